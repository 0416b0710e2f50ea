/**
 * @file interrupt_table.hpp
 * @brief Scoped interrupt table
 *
 * ISRs are ordinary closures registered inside a lexical scope:
 *
 *   fwcore::scope(NvicController{},
 *                 [](std::uint8_t irq) { LOG_IRQ("spurious %u", irq); },
 *                 [&](auto& table) {
 *                    auto tim6 = table.register_isr(InterruptRequest::Tim6Dac, Priority::P1,
 *                                                   [&] { ticks.send(Unit{}); });
 *                    run_forever(executor);
 *                 });
 *
 * Guarantees:
 * - At most one ISR per line; a second registration fails with AlreadyInUse
 * - An ISR only runs while the table exists: every line still registered
 *   when the scope exits is disabled and its slot emptied
 * - Environments passed to register_owned() live on the heap at a stable
 *   address owned by the table, and are handed back by unregister()
 */

#ifndef FWCORE_INTERRUPT_TABLE_HPP
#define FWCORE_INTERRUPT_TABLE_HPP

#include "fwcore/config.hpp"
#include "fwcore/interrupt_controller.hpp"
#include "fwcore/isr_table.hpp"
#include "fwcore/panic.hpp"

#include "DEBUG_PRINT.hpp"

#include <array>
#include <bitset>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace fwcore
{

namespace detail
{
   // Bumped on every scope entry; handles remember the scope that issued them
   inline std::uint64_t scope_generation = 0;
}

/**
 * @brief Proof that a line is registered
 *
 * @tparam T Type of the environment unregister() hands back (void for
 *           register_isr()).
 *
 * Move-only. Dropping a handle does not unregister the line; it stays
 * registered until unregister() or the end of the scope. A handle that
 * outlives its scope is rejected by every later table.
 */
template<typename T>
class InterruptHandle
{
public:
   InterruptHandle(InterruptHandle&& other) noexcept
      : irq_number(other.irq_number), generation(other.generation), live(std::exchange(other.live, false)) {}

   InterruptHandle& operator=(InterruptHandle&& other) noexcept
   {
      irq_number = other.irq_number;
      generation = other.generation;
      live       = std::exchange(other.live, false);
      return *this;
   }

   InterruptHandle(InterruptHandle const&)            = delete;
   InterruptHandle& operator=(InterruptHandle const&) = delete;

   [[nodiscard]] IrqNumber irq() const { return irq_number; }

   /**
    * @brief False once moved from or unregistered
    */
   [[nodiscard]] bool valid() const { return live; }

private:
   template<typename Controller>
   friend class InterruptTable;

   InterruptHandle(IrqNumber irq, std::uint64_t generation) : irq_number(irq), generation(generation), live(true) {}

   IrqNumber     irq_number;
   std::uint64_t generation;
   bool          live{false};
};

template<typename Controller>
class InterruptTable
{
   static_assert(std::derived_from<Controller, IInterruptController>,
                 "Controller must implement IInterruptController");

public:
   /**
    * @brief Run `body(table)` with interrupt support
    *
    * Installs `default_handler` (called with the IRQ number of any line
    * without an ISR), takes ownership of `controller` and builds the table.
    * The table is destroyed when `body` returns or throws.
    *
    * @return body's result, or AlreadyInScope if another scope is live
    */
   template<typename DefaultHandler, typename Body>
   static auto scope(Controller controller, DefaultHandler&& default_handler, Body&& body)
      -> std::expected<std::invoke_result_t<Body&, InterruptTable&>, InterruptError>
   {
      using Result = std::invoke_result_t<Body&, InterruptTable&>;

      if (!IsrTable::install_default(IsrTable::DefaultHandler(std::forward<DefaultHandler>(default_handler)))) {
         return std::unexpected(InterruptError{.kind = InterruptError::Kind::AlreadyInScope});
      }

      InterruptTable table(std::move(controller), ++detail::scope_generation);
      if constexpr (std::is_void_v<Result>) {
         std::invoke(body, table);
         return {};
      } else {
         return std::invoke(body, table);
      }
   }

   ~InterruptTable()
   {
      for (std::size_t i = 0; i < config::IRQ_COUNT; ++i) {
         if (!registered.test(i)) continue;

         IrqNumber const irq{static_cast<std::uint8_t>(i)};
         LOG_IRQ("scope exit: irq=%zu still registered, removing", i);
         controller.disable(irq);
         IsrTable::remove(irq);
         registered.reset(i);

         EnvCell cell = std::exchange(envs[i], EnvCell{});
         if (cell.destroy) cell.destroy(cell.data);
      }

      if (std::size_t const remaining = IsrTable::occupied_count(); remaining != 0) {
         panic("%zu interrupt(s) still installed while the interrupt table is dropped", remaining);
      }
      IsrTable::clear_default();
   }

   InterruptTable(InterruptTable const&)            = delete;
   InterruptTable& operator=(InterruptTable const&) = delete;
   InterruptTable(InterruptTable&&)                 = delete;
   InterruptTable& operator=(InterruptTable&&)      = delete;

   /**
    * @brief Install `isr` for `irq`, set its priority and enable the line
    *
    * `isr` may capture anything that outlives the table.
    */
   template<typename F>
   std::expected<InterruptHandle<void>, InterruptError> register_isr(IrqNumber irq, Priority priority, F&& isr)
   {
      static_assert(std::is_invocable_v<std::decay_t<F>&>, "ISR must be callable without arguments");

      if (auto error = check_free(irq)) return std::unexpected(*error);
      if (!IsrTable::install(irq, IsrTable::Isr(std::forward<F>(isr)))) {
         return std::unexpected(in_use(irq));
      }
      activate(irq, priority, EnvCell{});
      return InterruptHandle<void>(irq, generation);
   }

   /**
    * @brief Like register_isr(), but the ISR gets `T&` to an owned environment
    *
    * `env` is moved to the heap; the installed closure holds its address.
    * unregister() moves it back out.
    */
   template<typename T, typename F>
   std::expected<InterruptHandle<T>, InterruptError> register_owned(IrqNumber irq, Priority priority, T env, F&& isr)
   {
      static_assert(std::is_invocable_v<std::decay_t<F>&, T&>, "ISR must be callable with T&");

      if (auto error = check_free(irq)) return std::unexpected(*error);

      // Owned here until the ISR is installed; freed if building it throws
      auto owned = std::make_unique<T>(std::move(env));
      auto trampoline = [cell = owned.get(), fn = std::forward<F>(isr)]() mutable { fn(*cell); };

      if (!IsrTable::install(irq, IsrTable::Isr(std::move(trampoline)))) {
         return std::unexpected(in_use(irq));
      }
      activate(irq, priority, EnvCell{
         .data    = owned.release(),
         .destroy = [](void* p) { delete static_cast<T*>(p); },
      });
      return InterruptHandle<T>(irq, generation);
   }

   /**
    * @brief Disable the line, empty its slot and return the environment
    *
    * Panics on a moved-from handle, a handle issued by an earlier scope or
    * a line that is not registered.
    */
   template<typename T>
   T unregister(InterruptHandle<T>&& handle)
   {
      if (!handle.live) {
         panic("unregister called with an empty interrupt handle");
      }
      check_handle(handle);
      IrqNumber const irq = handle.irq_number;
      handle.live = false;

      if (!registered.test(irq.value)) {
         panic("unregister: IRQ %u is not registered", static_cast<unsigned>(irq.value));
      }

      controller.disable(irq);
      IsrTable::remove(irq);
      registered.reset(irq.value);
      LOG_IRQ("unregister: irq=%u", static_cast<unsigned>(irq.value));

      [[maybe_unused]] EnvCell cell = std::exchange(envs[irq.value], EnvCell{});
      if constexpr (std::is_void_v<T>) {
         return;
      } else {
         T* env = static_cast<T*>(cell.data);
         T out  = std::move(*env);
         delete env;
         return out;
      }
   }

   /**
    * @brief Register `isr`, run `body(table)`, unregister
    *
    * The line is unregistered even if `body` throws.
    */
   template<typename F, typename Body>
   auto with_interrupt(IrqNumber irq, Priority priority, F&& isr, Body&& body)
      -> std::expected<std::invoke_result_t<Body&, InterruptTable&>, InterruptError>
   {
      using Result = std::invoke_result_t<Body&, InterruptTable&>;

      auto handle = register_isr(irq, priority, std::forward<F>(isr));
      if (!handle) return std::unexpected(handle.error());

      struct Unregister
      {
         InterruptTable&         table;
         InterruptHandle<void>&  handle;
         ~Unregister() { table.unregister(std::move(handle)); }
      } guard{*this, *handle};

      if constexpr (std::is_void_v<Result>) {
         std::invoke(body, *this);
         return {};
      } else {
         return std::invoke(body, *this);
      }
   }

   template<typename T>
   void set_priority(InterruptHandle<T> const& handle, Priority priority)
   {
      check_handle(handle);
      controller.set_priority(handle.irq(), priority);
   }

   template<typename T>
   [[nodiscard]] Priority get_priority(InterruptHandle<T> const& handle) const
   {
      check_handle(handle);
      return controller.get_priority(handle.irq());
   }

   template<typename T>
   void set_pending_state(InterruptHandle<T> const& handle)
   {
      check_handle(handle);
      controller.pend(handle.irq());
   }

   template<typename T>
   void clear_pending_state(InterruptHandle<T> const& handle)
   {
      check_handle(handle);
      controller.unpend(handle.irq());
   }

   template<typename T>
   [[nodiscard]] bool get_pending_state(InterruptHandle<T> const& handle) const
   {
      check_handle(handle);
      return controller.is_pending(handle.irq());
   }

   /**
    * @brief Software-trigger any line, registered or not
    */
   void trigger(IrqNumber irq)
   {
      check_range(irq);
      controller.trigger(irq);
   }

   [[nodiscard]] bool is_registered(IrqNumber irq) const
   {
      return irq.value < config::IRQ_COUNT && registered.test(irq.value);
   }

   Controller&       interrupt_controller()       { return controller; }
   Controller const& interrupt_controller() const { return controller; }

private:
   // Owned environment of one line, type-erased
   struct EnvCell
   {
      void* data{nullptr};
      void (*destroy)(void*){nullptr};
   };

   InterruptTable(Controller controller, std::uint64_t generation)
      : controller(std::move(controller)), generation(generation) {}

   static void check_range(IrqNumber irq)
   {
      if (irq.value >= config::IRQ_COUNT) {
         panic("IRQ %u out of range (IRQ_COUNT=%zu)", static_cast<unsigned>(irq.value), config::IRQ_COUNT);
      }
   }

   template<typename T>
   void check_handle(InterruptHandle<T> const& handle) const
   {
      if (handle.generation != generation) {
         panic("interrupt handle for IRQ %u outlived its interrupt scope", static_cast<unsigned>(handle.irq_number.value));
      }
      check_range(handle.irq_number);
   }

   static InterruptError in_use(IrqNumber irq)
   {
      return InterruptError{.kind = InterruptError::Kind::AlreadyInUse, .irq = irq};
   }

   std::optional<InterruptError> check_free(IrqNumber irq) const
   {
      check_range(irq);
      if (registered.test(irq.value) || IsrTable::occupied(irq)) {
         LOG_IRQ("register: irq=%u already in use", static_cast<unsigned>(irq.value));
         return in_use(irq);
      }
      return std::nullopt;
   }

   void activate(IrqNumber irq, Priority priority, EnvCell cell)
   {
      envs[irq.value] = cell;
      registered.set(irq.value);
      controller.set_priority(irq, priority);
      controller.enable(irq);
      LOG_IRQ("register: irq=%u priority=%u", static_cast<unsigned>(irq.value),
              static_cast<unsigned>(std::to_underlying(priority)));
   }

   Controller                            controller;
   std::uint64_t                         generation;
   std::array<EnvCell, config::IRQ_COUNT> envs{};
   std::bitset<config::IRQ_COUNT>        registered;
};

/**
 * @brief Enter an interrupt scope; see InterruptTable::scope()
 */
template<typename Controller, typename DefaultHandler, typename Body>
auto scope(Controller controller, DefaultHandler&& default_handler, Body&& body)
{
   return InterruptTable<Controller>::scope(std::move(controller),
                                            std::forward<DefaultHandler>(default_handler),
                                            std::forward<Body>(body));
}

}  // namespace fwcore

#endif // FWCORE_INTERRUPT_TABLE_HPP
