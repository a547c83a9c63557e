#include <hostkit/window_event.hpp>

namespace hostkit
{

std::string_view to_string(WindowEventType type)
{
    switch (type)
    {
        case WindowEventType::Shown:
            return "Shown";
        case WindowEventType::Hidden:
            return "Hidden";
        case WindowEventType::FocusGained:
            return "FocusGained";
        case WindowEventType::FocusLost:
            return "FocusLost";
        case WindowEventType::Iconified:
            return "Iconified";
        case WindowEventType::Deiconified:
            return "Deiconified";
        case WindowEventType::Maximized:
            return "Maximized";
        case WindowEventType::Demaximized:
            return "Demaximized";
        case WindowEventType::Moved:
            return "Moved";
        case WindowEventType::Resized:
            return "Resized";
        case WindowEventType::Closed:
            return "Closed";
    }
    return "Unknown";
}

void deliver(HostClient& client, const WindowEvent& event)
{
    switch (event.type)
    {
        case WindowEventType::Shown:
            client.on_shown(event);
            break;
        case WindowEventType::Hidden:
            client.on_hidden(event);
            break;
        case WindowEventType::FocusGained:
            client.on_focus_gained(event);
            break;
        case WindowEventType::FocusLost:
            client.on_focus_lost(event);
            break;
        case WindowEventType::Iconified:
            client.on_iconified(event);
            break;
        case WindowEventType::Deiconified:
            client.on_deiconified(event);
            break;
        case WindowEventType::Maximized:
            client.on_maximized(event);
            break;
        case WindowEventType::Demaximized:
            client.on_demaximized(event);
            break;
        case WindowEventType::Moved:
            client.on_moved(event);
            break;
        case WindowEventType::Resized:
            client.on_resized(event);
            break;
        case WindowEventType::Closed:
            client.on_closed(event);
            break;
    }
}

}   // namespace hostkit
