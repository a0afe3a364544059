#pragma once

#include <mutex>
#include <ostream>

#include "ba/orchestrator/armor_engine.h"
#include "ba/orchestrator/event_bus.h"

namespace ba::orchestrator {

  // Renders engine events as the operator-facing progress lines.
  class ConsoleReporter {
  public:
    ConsoleReporter(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    void OnEvent(const Event& event);
    void PrintSummary(const RunSummary& summary);

    // Subscribes the reporter to the global bus. The reporter must outlive it.
    void Attach();

  private:
    std::mutex mutex_;
    std::ostream& out_;
    std::ostream& err_;
  };

} // namespace ba::orchestrator
