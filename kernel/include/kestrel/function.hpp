/**
 * @file function.hpp
 * @brief Move-only type-erased callable with inline storage
 *
 * Kernel paths that hold callables (task entry points, drain visitors) must
 * not allocate. Function keeps the callable inline; one that does not fit
 * InlineSize is a compile error.
 */

#ifndef KESTREL_FUNCTION_HPP
#define KESTREL_FUNCTION_HPP

#include <array>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace kestrel
{

template<typename Signature, std::size_t InlineSize = 32>
class Function;

template<typename Ret, typename... Args, std::size_t InlineSize>
class Function<Ret(Args...), InlineSize>
{
   struct Ops
   {
      Ret  (*invoke)(Function&, Args&&...);
      void (*relocate)(Function& dst, Function& src) noexcept;
      void (*destroy)(Function&) noexcept;
   };

   template<typename F>
   struct OpsFor
   {
      static F* target(Function& self) noexcept
      {
         return std::launder(reinterpret_cast<F*>(self.storage.data()));
      }

      static Ret invoke(Function& self, Args&&... args)
      {
         return (*target(self))(std::forward<Args>(args)...);
      }

      static void relocate(Function& dst, Function& src) noexcept
      {
         F* from = target(src);
         ::new (dst.storage.data()) F(std::move(*from));
         from->~F();
      }

      static void destroy(Function& self) noexcept
      {
         target(self)->~F();
      }

      static constexpr Ops table{&invoke, &relocate, &destroy};
   };

   Ops const* ops{nullptr};

   alignas(std::max_align_t) std::array<std::byte, InlineSize> storage{};

public:
   constexpr Function() = default;
   constexpr Function(std::nullptr_t) noexcept {}

   template<typename F, typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, Function>>>
   Function(F&& f)
   {
      emplace(std::forward<F>(f));
   }

   ~Function() { reset(); }

   Function(Function&& other) noexcept { take(other); }

   Function& operator=(Function&& other) noexcept
   {
      if (this != &other) {
         reset();
         take(other);
      }
      return *this;
   }

   Function(Function const&)            = delete;
   Function& operator=(Function const&) = delete;

   template<typename F>
   void emplace(F&& f)
   {
      using Callable = std::decay_t<F>;
      static_assert(std::is_invocable_r_v<Ret, Callable&, Args...>, "Callable does not match the Function signature");

      static_assert(sizeof(Callable) <= InlineSize, "Callable too large for inline storage");
      static_assert(alignof(Callable) <= alignof(std::max_align_t), "Callable over-aligned for inline storage");

      reset();
      ::new (storage.data()) Callable(std::forward<F>(f));
      ops = &OpsFor<Callable>::table;
   }

   // The stored callable may mutate its captures, the Function itself does not change
   Ret operator()(Args... args) const
   {
      return ops->invoke(const_cast<Function&>(*this), std::forward<Args>(args)...);
   }

   explicit operator bool() const noexcept { return ops != nullptr; }

   void reset() noexcept
   {
      if (ops) {
         ops->destroy(*this);
         ops = nullptr;
      }
   }

private:
   void take(Function& other) noexcept
   {
      if (!other.ops) return;
      other.ops->relocate(*this, other);
      ops = std::exchange(other.ops, nullptr);
   }
};

} // namespace kestrel

#endif // KESTREL_FUNCTION_HPP
