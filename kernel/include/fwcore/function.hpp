/**
 * @file function.hpp
 * @brief Type-erased callable with configurable storage
 *
 * Installed ISRs and the default interrupt handler are stored as Function
 * objects in the process-wide dispatch table, so invoking one must never
 * allocate. Whether constructing one may allocate is chosen per use through
 * the HeapPolicy.
 */

#ifndef FWCORE_FUNCTION_HPP
#define FWCORE_FUNCTION_HPP

#include <array>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace fwcore
{

/**
 * @brief What happens to a callable larger than the inline buffer
 */
enum class HeapPolicy
{
   NoHeap,      // Compile error
   CanUseHeap,  // Moved to the heap at construction
};

/**
 * @brief Move-only std::function replacement with deterministic storage
 *
 * @tparam Signature Function signature (e.g., void(), void(std::uint8_t))
 * @tparam InlineSize Size of inline storage buffer in bytes
 * @tparam Policy Heap allocation policy
 *
 * Example:
 *   Function<void(), 32, HeapPolicy::NoHeap> isr = [&counter] { ++counter; };
 *   isr();
 */
template<typename Signature, std::size_t InlineSize = 32, HeapPolicy Policy = HeapPolicy::NoHeap>
class Function;

template<typename Ret, typename... Args, std::size_t InlineSize, HeapPolicy Policy>
class Function<Ret(Args...), InlineSize, Policy>
{
   static constexpr bool AllowHeap = (Policy != HeapPolicy::NoHeap);

   struct Ops
   {
      Ret  (*invoke)(Function&, Args&&...);
      void (*relocate)(Function& dst, Function& src) noexcept;
      void (*destroy)(Function&) noexcept;
   };

   Ops const* ops{nullptr};

   union Storage
   {
      alignas(std::max_align_t) std::array<std::byte, InlineSize> buffer;
      void* heap;
   } storage{};

   template<typename F>
   static constexpr bool stored_on_heap = (sizeof(F) > InlineSize) || (alignof(F) > alignof(std::max_align_t));

public:
   constexpr Function() = default;

   template<typename F>
      requires (!std::is_same_v<std::decay_t<F>, Function>)
   Function(F&& f)
   {
      construct(std::forward<F>(f));
   }

   ~Function()
   {
      reset();
   }

   Function(Function&& other) noexcept
   {
      take(other);
   }

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

   /**
    * @brief Invoke the stored callable
    *
    * const because the stored target does not change; the callable itself
    * may still mutate its captures (mutable lambdas).
    */
   Ret operator()(Args... args) const
   {
      return ops->invoke(const_cast<Function&>(*this), std::forward<Args>(args)...);
   }

   explicit operator bool() const noexcept
   {
      return ops != nullptr;
   }

   void reset() noexcept
   {
      if (ops) {
         ops->destroy(*this);
         ops = nullptr;
      }
   }

private:
   template<typename F>
   void construct(F&& f)
   {
      using Callable = std::decay_t<F>;

      static_assert(std::is_invocable_r_v<Ret, Callable&, Args...>,
                    "Callable signature does not match Function signature");
      static_assert(AllowHeap || !stored_on_heap<Callable>,
                    "Callable too large for inline storage. "
                    "Increase InlineSize or allow heap allocation.");

      if constexpr (stored_on_heap<Callable>) {
         storage.heap = new Callable(std::forward<F>(f));
      } else {
         ::new (storage.buffer.data()) Callable(std::forward<F>(f));
      }
      ops = &OpsFor<Callable>::table;
   }

   template<typename F>
   struct OpsFor
   {
      static F& target(Function& self) noexcept
      {
         if constexpr (stored_on_heap<F>) {
            return *static_cast<F*>(self.storage.heap);
         } else {
            return *std::launder(reinterpret_cast<F*>(self.storage.buffer.data()));
         }
      }

      static Ret invoke(Function& self, Args&&... args)
      {
         return target(self)(std::forward<Args>(args)...);
      }

      static void relocate(Function& dst, Function& src) noexcept
      {
         if constexpr (stored_on_heap<F>) {
            dst.storage.heap = std::exchange(src.storage.heap, nullptr);
         } else {
            F& from = target(src);
            ::new (dst.storage.buffer.data()) F(std::move(from));
            from.~F();
         }
      }

      static void destroy(Function& self) noexcept
      {
         if constexpr (stored_on_heap<F>) {
            delete static_cast<F*>(self.storage.heap);
            self.storage.heap = nullptr;
         } else {
            target(self).~F();
         }
      }

      static constexpr Ops table{
         .invoke   = &OpsFor::invoke,
         .relocate = &OpsFor::relocate,
         .destroy  = &OpsFor::destroy,
      };
   };

   void take(Function& other) noexcept
   {
      if (!other.ops) return;
      other.ops->relocate(*this, other);
      ops = std::exchange(other.ops, nullptr);
   }
};

}  // namespace fwcore

#endif // FWCORE_FUNCTION_HPP
