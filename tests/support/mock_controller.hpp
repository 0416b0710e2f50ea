/**
 * @file mock_controller.hpp
 * @brief Recording IInterruptController test double
 */

#ifndef FWCORE_TESTS_MOCK_CONTROLLER_HPP
#define FWCORE_TESTS_MOCK_CONTROLLER_HPP

#include "fwcore/config.hpp"
#include "fwcore/interrupt_controller.hpp"
#include "fwcore/isr_table.hpp"

#include <array>
#include <memory>
#include <vector>

namespace fwcore::test
{

enum class Op
{
   Trigger,
   Pend,
   Unpend,
   SetPriority,
   Enable,
   Disable,
};

struct MockCall
{
   Op           op;
   std::uint8_t irq;

   bool operator==(MockCall const&) const = default;
};

struct MockState
{
   std::vector<MockCall>                     calls;
   std::array<bool, config::IRQ_COUNT>     enabled{};
   std::array<bool, config::IRQ_COUNT>     pending{};
   std::array<Priority, config::IRQ_COUNT> priority{};

   [[nodiscard]] std::vector<MockCall> calls_for(std::uint8_t irq) const
   {
      std::vector<MockCall> out;
      for (auto const& call : calls) {
         if (call.irq == irq) out.push_back(call);
      }
      return out;
   }
};

/**
 * @brief Controller that records every call
 *
 * trigger() on an enabled line dispatches through IsrTable::handle()
 * synchronously, as if the exception were taken immediately. The state is
 * shared so tests can inspect it after the table took ownership.
 */
class MockController final : public IInterruptController
{
public:
   explicit MockController(std::shared_ptr<MockState> state = std::make_shared<MockState>())
      : state(std::move(state)) {}

   void trigger(IrqNumber irq) override
   {
      record(Op::Trigger, irq);
      state->pending[irq.value] = true;
      if (state->enabled[irq.value]) {
         state->pending[irq.value] = false;
         IsrTable::handle(irq);
      }
   }

   [[nodiscard]] bool is_pending(IrqNumber irq) const override { return state->pending[irq.value]; }

   void pend(IrqNumber irq) override
   {
      record(Op::Pend, irq);
      state->pending[irq.value] = true;
   }

   void unpend(IrqNumber irq) override
   {
      record(Op::Unpend, irq);
      state->pending[irq.value] = false;
   }

   [[nodiscard]] Priority get_priority(IrqNumber irq) const override { return state->priority[irq.value]; }

   void set_priority(IrqNumber irq, Priority priority) override
   {
      record(Op::SetPriority, irq);
      state->priority[irq.value] = priority;
   }

   void enable(IrqNumber irq) override
   {
      record(Op::Enable, irq);
      state->enabled[irq.value] = true;
   }

   void disable(IrqNumber irq) override
   {
      record(Op::Disable, irq);
      state->enabled[irq.value] = false;
   }

   std::shared_ptr<MockState> state;

private:
   void record(Op op, IrqNumber irq) { state->calls.push_back({op, irq.value}); }
};

}  // namespace fwcore::test

#endif // FWCORE_TESTS_MOCK_CONTROLLER_HPP
