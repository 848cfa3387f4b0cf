#pragma once

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace vencode {

// Pool of reusable objects, for scratch objects that are expensive to rebuild (buffers keeping their capacity).
// Unlike an object pool, released objects are NOT destroyed: they stay constructed in a free list and are handed
// back as-is by the next acquire(). Callers must not assume anything about the contents of an acquired object.
// Object pointers remain valid until the pool is destroyed.
// All constructed objects are destroyed when the pool is destroyed.
template <class T>
class RecyclingPool {
 public:
  static constexpr std::size_t kDefaultInitialCapacity = 4U;
  static constexpr std::size_t kGrowthFactor = 2U;

  using size_type = std::size_t;

  RecyclingPool() noexcept = default;

  RecyclingPool(const RecyclingPool &) = delete;
  RecyclingPool &operator=(const RecyclingPool &) = delete;

  RecyclingPool(RecyclingPool &&other) noexcept
      : _lastBlock(std::exchange(other._lastBlock, nullptr)),
        _freeList(std::exchange(other._freeList, nullptr)),
        _nextSlot(std::exchange(other._nextSlot, nullptr)),
        _nbConstructed(std::exchange(other._nbConstructed, 0)),
        _nbInUse(std::exchange(other._nbInUse, 0)) {}

  RecyclingPool &operator=(RecyclingPool &&other) noexcept {
    if (this != &other) {
      destroyAll();
      _lastBlock = std::exchange(other._lastBlock, nullptr);
      _freeList = std::exchange(other._freeList, nullptr);
      _nextSlot = std::exchange(other._nextSlot, nullptr);
      _nbConstructed = std::exchange(other._nbConstructed, 0);
      _nbInUse = std::exchange(other._nbInUse, 0);
    }
    return *this;
  }

  ~RecyclingPool() { destroyAll(); }

  // Returns a previously released object if any, otherwise a newly default constructed one.
  [[nodiscard]] T *acquire();

  // Gives back an object obtained from acquire(). The object is kept alive for reuse.
  void release(T *obj) noexcept;

  // Marks every constructed object as free again, for instance after an aborted operation which could not
  // release what it acquired.
  void recycleAll() noexcept;

  // Number of objects currently acquired and not released.
  [[nodiscard]] size_type size() const noexcept { return _nbInUse; }

  // Number of objects constructed by the pool, in use or not.
  [[nodiscard]] size_type nbConstructed() const noexcept { return _nbConstructed; }

 private:
  struct Slot {
    alignas(T) std::byte storage[sizeof(T)];
    Slot *nextFree;

    // only for slots holding a constructed object
    T *ptr() noexcept { return std::launder(reinterpret_cast<T *>(storage)); }
  };

  static_assert(std::is_standard_layout_v<Slot>);

  struct Block {
    Block *_prevBlock;
    size_type _blockSize;
  };

  static constexpr size_type kSlotAlign = static_cast<size_type>(std::alignment_of_v<Slot>);
  static constexpr size_type kMallocPadding = ((kSlotAlign - (sizeof(Block) % kSlotAlign)) % kSlotAlign);

  static Slot *slotBegin(Block *block) noexcept {
    return reinterpret_cast<Slot *>(reinterpret_cast<std::byte *>(block + 1) + kMallocPadding);
  }
  static Slot *slotEnd(Block *block) noexcept { return slotBegin(block) + block->_blockSize; }

  // storage is the first member of a standard layout Slot, so both share the same address.
  static Slot *slotFromObject(T *obj) noexcept { return reinterpret_cast<Slot *>(obj); }

  void addBlock() {
    const size_type newBlockSize = _lastBlock == nullptr ? kDefaultInitialCapacity : _lastBlock->_blockSize * kGrowthFactor;

    auto *newBlock = static_cast<Block *>(std::malloc(sizeof(Block) + kMallocPadding + (newBlockSize * sizeof(Slot))));
    if (newBlock == nullptr) {
      throw std::bad_alloc();
    }

    newBlock->_prevBlock = _lastBlock;
    newBlock->_blockSize = newBlockSize;
    _lastBlock = newBlock;
    _nextSlot = slotBegin(newBlock);
  }

  template <class Func>
  void forEachConstructed(Func &&func) noexcept {
    for (Block *block = _lastBlock; block != nullptr; block = block->_prevBlock) {
      Slot *last = block == _lastBlock ? _nextSlot : slotEnd(block);
      for (Slot *slot = slotBegin(block); slot != last; ++slot) {
        func(slot);
      }
    }
  }

  void destroyAll() noexcept {
    if constexpr (!std::is_trivially_destructible_v<T>) {
      forEachConstructed([](Slot *slot) { std::destroy_at(slot->ptr()); });
    }
    for (Block *block = _lastBlock; block != nullptr;) {
      Block *prev = block->_prevBlock;
      std::free(block);
      block = prev;
    }
    _lastBlock = nullptr;
    _freeList = nullptr;
    _nextSlot = nullptr;
    _nbConstructed = 0;
    _nbInUse = 0;
  }

  Block *_lastBlock{nullptr};
  Slot *_freeList{nullptr};
  Slot *_nextSlot{nullptr};
  size_type _nbConstructed{0};
  size_type _nbInUse{0};
};

template <class T>
T *RecyclingPool<T>::acquire() {
  if (_freeList != nullptr) {
    Slot *slot = std::exchange(_freeList, _freeList->nextFree);
    ++_nbInUse;
    return slot->ptr();
  }
  if (_lastBlock == nullptr || _nextSlot == slotEnd(_lastBlock)) {
    addBlock();
  }
  Slot *slot = _nextSlot;
  // if construction throws, _nextSlot is not advanced and the slot stays available.
  T *obj = std::construct_at(reinterpret_cast<T *>(slot->storage));
  ++_nextSlot;
  ++_nbConstructed;
  ++_nbInUse;
  return obj;
}

template <class T>
void RecyclingPool<T>::release(T *obj) noexcept {
  assert(obj != nullptr);
  assert(_nbInUse != 0);

  Slot *slot = slotFromObject(obj);
  slot->nextFree = _freeList;
  _freeList = slot;
  --_nbInUse;
}

template <class T>
void RecyclingPool<T>::recycleAll() noexcept {
  _freeList = nullptr;
  forEachConstructed([this](Slot *slot) {
    slot->nextFree = _freeList;
    _freeList = slot;
  });
  _nbInUse = 0;
}

}  // namespace vencode
