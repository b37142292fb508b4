/**
 * @file sim_scheduler.cpp
 * @brief Simulated multi-CPU scheduler
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/sim_scheduler.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/port.h"

#include <cassert>
#include <thread>
#include <vector>

namespace kestrel::sim
{

/* ============================================================================
 * RunQueue
 * ========================================================================= */

// Walks the list, debugging only
std::size_t SimScheduler::RunQueue::size() const noexcept
{
   std::size_t n = 0;
   for (auto* task = head; task; task = task->sched.next) ++n;
   return n;
}

void SimScheduler::RunQueue::push_back(Task* task) noexcept
{
   assert(!task->sched.queued && "Task already queued");
   task->sched.next = nullptr;
   task->sched.prev = tail;
   if (tail) tail->sched.next = task; else head = task;
   tail = task;
   task->sched.queued = true;
}

Task* SimScheduler::RunQueue::pop_front() noexcept
{
   if (!head) return nullptr;
   auto* task = head;
   head = task->sched.next;
   if (head) head->sched.prev = nullptr; else tail = nullptr;
   task->sched.next = task->sched.prev = nullptr;
   task->sched.queued = false;
   return task;
}

void SimScheduler::RunQueue::remove(Task* task) noexcept
{
   if (task->sched.prev) task->sched.prev->sched.next = task->sched.next; else head = task->sched.next;
   if (task->sched.next) task->sched.next->sched.prev = task->sched.prev; else tail = task->sched.prev;
   task->sched.next = task->sched.prev = nullptr;
   task->sched.queued = false;
}

/* ============================================================================
 * SimScheduler
 * ========================================================================= */

SimScheduler::SimScheduler(Mode mode, std::uint32_t cpu_count, ITimeDriver& time)
   : run_mode(mode)
   , cpu_total(cpu_count)
   , time(time)
{
   kernel::initialise(cpu_count, *this, time);
   time.start();

   if (run_mode == Mode::Deterministic) {
      for (std::uint32_t cpu = 0; cpu < cpu_total; ++cpu) {
         kernel::cpus().at(cpu)->start();
      }
   }
   LOG_SCHED("sim scheduler: %u cpus, %s", cpu_count, run_mode == Mode::Deterministic ? "deterministic" : "threaded");
}

SimScheduler::~SimScheduler()
{
   if (live_tasks() != 0) {
      LOG_FAULT("sim scheduler destroyed with %zu live tasks", live_tasks());
   }
}

Task* SimScheduler::current() noexcept
{
   auto const core = kestrel_port_get_core_id();
   if (core >= cpu_total) return nullptr;
   return runtimes[core].current.load(std::memory_order_acquire);
}

void SimScheduler::suspend_current(SuspendReason reason, TimePoint wake_at)
{
   Task* task = current();
   if (!task) {
      LOG_FAULT("suspend_current(%s) outside task context", to_string(reason).data());
      return;
   }

   if (task->sched.deadline.id != 0) {
      (void)time.cancel(task->sched.deadline);
      task->sched.deadline = {};
   }
   task->sched.wake_at.store(wake_at.value, std::memory_order_release);

   if (wake_at != TimePoint::max()) {
      if (time.now() >= wake_at) return;
      task->sched.deadline = time.schedule_at(wake_at, &SimScheduler::deadline_expired, task);
   }

   LOG_SCHED("task %u suspended (%s)", task->id(), to_string(reason).data());
   kestrel_port_yield();
}

void SimScheduler::resume(Task& task)
{
   CpuDescriptor* cpu = kernel::cpus().at(task.cpu());
   if (!cpu || !cpu->post(CpuRequest{CpuRequest::Kind::ResumeTask, &task, nullptr})) {
      LOG_FAULT("resume of task %u lost", task.id());
   }
}

void SimScheduler::terminate(Task& task)
{
   if (&task == current()) {
      LOG_SCHED("task %u terminates itself", task.id());
      task.set_state(Task::State::Terminated);
      kestrel_port_thread_exit();
   }

   CpuDescriptor* cpu = kernel::cpus().at(task.cpu());
   if (!cpu || !cpu->post(CpuRequest{CpuRequest::Kind::KillTask, &task, nullptr})) {
      LOG_FAULT("kill of task %u lost", task.id());
   }
}

void SimScheduler::relax()
{
   kestrel_port_cpu_relax();
   kestrel_port_yield();
}

void SimScheduler::yield()
{
   kestrel_port_yield();
}

Status SimScheduler::spawn(Task& task, CoreAffinity affinity)
{
   if (task.stack().empty() || !task.entry()) return Status::InvalidArgument;

   auto const cpu = kernel::cpus().least_loaded(affinity);
   if (!cpu) return Status::InvalidArgument;

   kernel::cpus().pin(task, *cpu);
   kestrel_port_context_init(task.context(), task.stack().data(), task.stack().size(), &SimScheduler::task_launcher, &task);

   task.sched.next         = nullptr;
   task.sched.prev         = nullptr;
   task.sched.queued       = false;
   task.sched.context_live = true;
   task.sched.reaped       = false;
   task.set_state(Task::State::Ready);
   live.fetch_add(1, std::memory_order_acq_rel);

   if (!kernel::cpus().at(*cpu)->post(CpuRequest{CpuRequest::Kind::ResumeTask, &task, nullptr})) {
      task.sched.context_live = false;
      kestrel_port_context_destroy(task.context());
      kernel::cpus().unpin(task);
      live.fetch_sub(1, std::memory_order_acq_rel);
      return Status::ResourceExhausted;
   }

   LOG_SCHED("task %u spawned on cpu%u", task.id(), *cpu);
   return Status::Ok;
}

void SimScheduler::retire(Task& task)
{
   if (task.sched.reaped) return;

   auto const previous_core = kestrel_port_get_core_id();
   kestrel_port_set_core_id(task.cpu());
   reap(task);
   kestrel_port_set_core_id(previous_core);
}

void SimScheduler::kill_process(Process& process)
{
   for (std::uint32_t cpu = 0; cpu < cpu_total; ++cpu) {
      if (!kernel::cpus().at(cpu)->post(CpuRequest{CpuRequest::Kind::KillProcess, nullptr, &process})) {
         LOG_FAULT("kill of process %u lost on cpu%u", process.id(), cpu);
      }
   }
}

bool SimScheduler::step()
{
   assert(run_mode == Mode::Deterministic);

   auto const previous_core = kestrel_port_get_core_id();
   bool progressed = false;
   for (std::uint32_t cpu = 0; cpu < cpu_total; ++cpu) {
      kestrel_port_set_core_id(cpu);
      progressed |= dispatch_one(cpu);
   }
   kestrel_port_set_core_id(previous_core);
   return progressed;
}

bool SimScheduler::run_threaded(std::chrono::milliseconds limit)
{
   assert(run_mode == Mode::Threaded);

   stop_requested.store(false, std::memory_order_release);

   std::vector<std::thread> hosts;
   hosts.reserve(cpu_total);
   for (std::uint32_t cpu = 0; cpu < cpu_total; ++cpu) {
      hosts.emplace_back([this, cpu] {
         kestrel_port_set_core_id(cpu);
         kernel::cpus().at(cpu)->start();

         while (live_tasks() > 0 && !stop_requested.load(std::memory_order_acquire)) {
            if (!dispatch_one(cpu)) kestrel_port_idle();
         }
      });
   }

   auto const give_up = std::chrono::steady_clock::now() + limit;
   while (live_tasks() > 0 && std::chrono::steady_clock::now() < give_up) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
   }

   stop_requested.store(true, std::memory_order_release);
   for (auto& host : hosts) host.join();

   return live_tasks() == 0;
}

void SimScheduler::task_launcher(void* arg)
{
   auto* task = static_cast<Task*>(arg);
   LOG_SCHED("task %u starting", task->id());
   task->entry()();
   task->set_state(Task::State::Terminated);
}

// Timer interrupt context
void SimScheduler::deadline_expired(void* arg)
{
   auto* task = static_cast<Task*>(arg);

   // Stale: the task has since woken up, or waits for a later deadline
   if (task->state() != Task::State::Blocked) return;
   if (kernel::now().value < task->sched.wake_at.load(std::memory_order_acquire)) return;

   if (task->mark_runnable()) {
      kernel::scheduler().resume(*task);
   }
}

bool SimScheduler::dispatch_one(std::uint32_t cpu)
{
   CpuDescriptor* descriptor = kernel::cpus().at(cpu);
   assert(descriptor);
   CpuRuntime& runtime = runtimes[cpu];

   if (descriptor->enter_kernel()) {
      LOG_FAULT("cpu%u: nested kernel entry", cpu);
   }

   std::size_t const handled = descriptor->drain([this, cpu](CpuRequest const& request) {
      handle_request(cpu, request);
   });

   Task* task = runtime.ready.pop_front();
   if (!task) {
      descriptor->leave_kernel();
      return handled > 0;
   }

   if (task->state() == Task::State::Terminated) {
      reap(*task);
      descriptor->leave_kernel();
      return true;
   }
   if (task->state() == Task::State::Ready) task->set_state(Task::State::Running);

   runtime.current.store(task, std::memory_order_release);
   descriptor->leave_kernel();

   kestrel_port_switch(nullptr, task->context());

   if (descriptor->enter_kernel()) {
      LOG_FAULT("cpu%u: kernel entered while task %u ran", cpu, task->id());
   }
   runtime.current.store(nullptr, std::memory_order_release);

   if (kestrel_port_context_finished(task->context())) {
      LOG_SCHED("task %u finished", task->id());
      reap(*task);
   } else {
      switch (task->state()) {
         case Task::State::Running:
            task->set_state(Task::State::Ready);
            [[fallthrough]];
         case Task::State::Ready:
         case Task::State::Spinning:
            if (!task->sched.queued) runtime.ready.push_back(task);
            break;
         case Task::State::Terminated:
            reap(*task);
            break;
         case Task::State::Blocked:
            break;
      }
   }

   descriptor->leave_kernel();
   return true;
}

void SimScheduler::handle_request(std::uint32_t cpu, CpuRequest const& request)
{
   switch (request.kind) {
      case CpuRequest::Kind::ResumeTask:
         make_ready(runtimes[cpu], *request.task);
         break;

      case CpuRequest::Kind::KillTask:
         LOG_SCHED("cpu%u: killing task %u", cpu, request.task->id());
         reap(*request.task);
         break;

      case CpuRequest::Kind::KillProcess:
         for (std::size_t i = 0; i < request.process->thread_count(); ++i) {
            Task* thread = request.process->thread(i);
            if (thread && thread->cpu() == cpu) reap(*thread);
         }
         break;
   }
}

void SimScheduler::make_ready(CpuRuntime& runtime, Task& task) noexcept
{
   if (task.sched.reaped || task.sched.queued) return;
   if (task.state() != Task::State::Ready) return;
   if (runtime.current.load(std::memory_order_acquire) == &task) return;

   runtime.ready.push_back(&task);
}

void SimScheduler::reap(Task& task)
{
   if (task.sched.reaped) return;
   task.sched.reaped = true;

   CpuRuntime& runtime = runtimes[task.cpu()];
   if (task.sched.queued) runtime.ready.remove(&task);

   if (task.sched.deadline.id != 0) {
      (void)time.cancel(task.sched.deadline);
      task.sched.deadline = {};
   }

   task.cancel_wait();
   task.set_state(Task::State::Terminated);

   if (task.sched.context_live) {
      task.sched.context_live = false;

      // Unwind as the current task, so RAII guards on its stack can release
      Task* previous = runtime.current.exchange(&task, std::memory_order_acq_rel);
      kestrel_port_context_destroy(task.context());
      runtime.current.store(previous, std::memory_order_release);

      live.fetch_sub(1, std::memory_order_acq_rel);
   }

   kernel::cpus().unpin(task);
   LOG_SCHED("task %u reaped", task.id());
}

} // namespace kestrel::sim
