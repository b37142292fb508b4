/**
 * @file mpsc_ring_buffer.hpp
 * @brief Lock-free multi-producer single-consumer ring buffer
 *
 * Backs each CPU's request inbox: any CPU (or a timer interrupt) posts,
 * only the owning CPU drains. Fixed power-of-two capacity, no allocation.
 *
 * Each cell carries a sequence number (Vyukov's bounded queue):
 * - sequence == position:     free, a producer may claim it
 * - sequence == position + 1: holds an item for the consumer
 * - sequence == position + N: freed by the consumer, ready for the next lap
 */

#ifndef KESTREL_MPSC_RING_BUFFER_HPP
#define KESTREL_MPSC_RING_BUFFER_HPP

#include "kestrel/port.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace kestrel
{

template<typename T, std::size_t N>
class MpscRingBuffer
{
   static_assert(N > 0, "Buffer capacity must be greater than zero");
   static_assert((N & (N - 1)) == 0, "Buffer capacity must be a power of two");
   static_assert(std::is_nothrow_destructible_v<T>, "T must be nothrow destructible");

public:
   constexpr MpscRingBuffer() noexcept : MpscRingBuffer(std::make_index_sequence<N>{}) {}

   MpscRingBuffer(MpscRingBuffer const&)            = delete;
   MpscRingBuffer& operator=(MpscRingBuffer const&) = delete;

   // Producers must have stopped
   ~MpscRingBuffer() noexcept
   {
      T discard;
      while (pop(discard)) {}
   }

   /**
    * @brief Element count, may be stale under contention (statistics only)
    */
   [[nodiscard]] std::size_t approx_size() const noexcept
   {
      auto const h = head.load(std::memory_order_acquire);
      auto const t = tail.load(std::memory_order_acquire);
      return (h >= t) ? (h - t) : 0;
   }

   /**
    * @brief Push from any thread
    * @return false if the buffer is full
    */
   template<typename U>
   bool push(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>)
   {
      auto position = head.load(std::memory_order_relaxed);

      while (true) {
         auto& cell = cells[position & mask];
         auto const sequence = cell.sequence.load(std::memory_order_acquire);
         auto const diff = static_cast<std::intptr_t>(sequence) - static_cast<std::intptr_t>(position);

         if (diff == 0) {
            if (head.compare_exchange_weak(position, position + 1,
                                           std::memory_order_relaxed,
                                           std::memory_order_relaxed)) {
               ::new (cell.storage.data()) T(std::forward<U>(value));
               cell.sequence.store(position + 1, std::memory_order_release);
               return true;
            }
         } else if (diff < 0) {
            return false; // consumer has not freed this cell yet
         } else {
            position = head.load(std::memory_order_relaxed);
         }
      }
   }

   /**
    * @brief Pop, owning consumer only
    * @return false if empty (or a producer is mid-publish)
    */
   bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>)
   {
      auto const position = tail.load(std::memory_order_relaxed);
      auto& cell = cells[position & mask];

      auto const sequence = cell.sequence.load(std::memory_order_acquire);
      if (static_cast<std::intptr_t>(sequence) - static_cast<std::intptr_t>(position + 1) != 0) {
         return false;
      }

      tail.store(position + 1, std::memory_order_relaxed);
      auto& item = cell.item();
      out = std::move(item);
      item.~T();
      cell.sequence.store(position + N, std::memory_order_release);
      return true;
   }

private:
   static constexpr std::size_t mask = N - 1;

   struct Cell
   {
      std::atomic<std::size_t> sequence;
      alignas(T) std::array<std::byte, sizeof(T)> storage{};

      constexpr explicit Cell(std::size_t seq) noexcept : sequence(seq) {}

      T& item() noexcept { return *std::launder(reinterpret_cast<T*>(storage.data())); }
   };

   template<std::size_t... Is>
   constexpr explicit MpscRingBuffer(std::index_sequence<Is...>) noexcept : cells{ Cell{Is}... } {}

   // Producer and consumer counters on separate cache lines
   alignas(KESTREL_PORT_CACHE_LINE) std::atomic<std::size_t> head{0};
   alignas(KESTREL_PORT_CACHE_LINE) std::atomic<std::size_t> tail{0};
   alignas(KESTREL_PORT_CACHE_LINE) std::array<Cell, N> cells;
};

}  // namespace kestrel

#endif // KESTREL_MPSC_RING_BUFFER_HPP
