#include "toolshed/types.hpp"

namespace toolshed {

std::optional<ToolReference> parse_tool_reference(const std::string& text) {
    auto at_pos = text.rfind('@');
    if (at_pos == std::string::npos || at_pos == 0 || at_pos + 1 >= text.size()) {
        return std::nullopt;
    }

    ToolReference ref;
    ref.id = text.substr(0, at_pos);
    ref.version = text.substr(at_pos + 1);
    return ref;
}

} // namespace toolshed
