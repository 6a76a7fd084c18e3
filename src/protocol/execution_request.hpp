#pragma once
#include <optional>
#include <string>

namespace toolbridge::protocol {

    // One decoded input line. Lives for a single loop iteration.
    struct ExecutionRequest {
        std::string code;
        std::optional<std::string> request_id;
    };

} // namespace toolbridge::protocol
