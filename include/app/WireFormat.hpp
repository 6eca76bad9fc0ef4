#pragma once
#include <string>
#include <vector>
#include "app/StateStore.hpp"

namespace ifwatch::app {

// JSON messages sent to display clients. Every payload is an object with a
// "type" field and named members only.

// {"type":"full_state","interfaces":[...]} covering every configured interface
[[nodiscard]] std::string full_state_message(const std::vector<InterfaceState>& states);

// {"type":"interface_update","interface":{...}} for one new sample
[[nodiscard]] std::string interface_update_message(const InterfaceState& state);

// {"type":"interface_status",...} on status or failure-count change
[[nodiscard]] std::string interface_status_message(const std::string& id, const model::InterfaceHealth& health);

// Fragment used by the messages above, exposed for tests.
void append_interface_state(std::string& out, const InterfaceState& state);

} // namespace ifwatch::app
