#include "peerdrop/client/direct_link.hpp"

namespace peerdrop::client
{

    std::string_view to_string(LinkState state) noexcept
    {
        switch (state)
        {
        case LinkState::New:
            return "new";
        case LinkState::Connecting:
            return "connecting";
        case LinkState::Connected:
            return "connected";
        case LinkState::Failed:
            return "failed";
        case LinkState::Closed:
            return "closed";
        }
        return "unknown";
    }

} // namespace peerdrop::client
