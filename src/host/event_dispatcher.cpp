#include "event_dispatcher.hpp"

#include <hostkit/logger.hpp>
#include <stdexcept>

namespace hostkit
{

EventDispatcher::EventDispatcher(std::shared_ptr<HostClient> client,
                                 const HostConfig&           config,
                                 DispatchContext&            context,
                                 Parts                       parts)
    : client_(std::move(client)), config_(config), context_(context), parts_(parts)
{
    if (!client_)
        throw std::invalid_argument("EventDispatcher: client must not be null");
}

void EventDispatcher::fire(WindowEventType type)
{
    HOSTKIT_LOG_DEBUG("host", "Firing {}", to_string(type));

    run_bookkeeping(type);
    parts_.stability.on_fired(type);
    apply_state(type);
    ++fired_count_;

    const WindowEvent event{context_.dispatch_host(), type};
    if (!config_.use_exception_handler_for_client)
    {
        deliver(*client_, event);
        return;
    }
    try
    {
        deliver(*client_, event);
    }
    catch (const std::exception& e)
    {
        HOSTKIT_LOG_ERROR("host", "Client failed on {}: {}", to_string(type), e.what());
        context_.handle_exception(std::current_exception());
    }
}

void EventDispatcher::run_bookkeeping(WindowEventType type)
{
    switch (type)
    {
        case WindowEventType::Shown:
            context_.set_restore_max_intent(!state_.iconified
                                            && config_.restore_maximized_across_iconify);
            if (!state_.iconified)
            {
                if (state_.maximized)
                    parts_.bounds.arm_max_if_configured();
                else
                    parts_.bounds.arm_demax_if_configured_and_any();
            }
            break;
        case WindowEventType::Hidden:
            parts_.drag.cancel();
            break;
        case WindowEventType::FocusGained:
            parts_.stability.set_unstability(context_.now_s());
            parts_.paint.make_all_dirty_and_ensure_pending_painting();
            context_.on_client_focus_gained();
            break;
        case WindowEventType::FocusLost:
            parts_.stability.set_unstability(context_.now_s());
            if (!context_.is_host_closed())
                parts_.paint.make_all_dirty_and_ensure_pending_painting();
            context_.on_client_focus_lost();
            parts_.drag.cancel();
            break;
        case WindowEventType::Iconified:
            parts_.drag.cancel();
            break;
        case WindowEventType::Deiconified:
            if (config_.request_focus_on_deiconified)
                context_.request_focus_gain_async();
            context_.set_restore_max_intent(config_.restore_maximized_across_iconify);
            if (state_.maximized)
                parts_.bounds.arm_max_if_configured();
            else
                parts_.bounds.arm_demax_if_configured_and_any();
            break;
        case WindowEventType::Maximized:
            parts_.drag.cancel();
            parts_.bounds.arm_max_if_configured();
            break;
        case WindowEventType::Demaximized:
            parts_.drag.cancel();
            parts_.bounds.arm_demax_if_configured_and_any();
            break;
        case WindowEventType::Closed:
            context_.on_closed_event_firing();
            break;
        case WindowEventType::Moved:
        case WindowEventType::Resized:
            break;
    }
}

void EventDispatcher::apply_state(WindowEventType type)
{
    switch (type)
    {
        case WindowEventType::Shown:
            state_.showing = true;
            break;
        case WindowEventType::Hidden:
            state_.showing = false;
            break;
        case WindowEventType::FocusGained:
            state_.focused = true;
            break;
        case WindowEventType::FocusLost:
            state_.focused = false;
            break;
        case WindowEventType::Iconified:
            state_.iconified = true;
            break;
        case WindowEventType::Deiconified:
            state_.iconified = false;
            break;
        case WindowEventType::Maximized:
            state_.maximized = true;
            break;
        case WindowEventType::Demaximized:
            state_.maximized = false;
            break;
        case WindowEventType::Moved:
            state_.move_pending = false;
            break;
        case WindowEventType::Resized:
            state_.resize_pending = false;
            break;
        case WindowEventType::Closed:
            state_.closed = true;
            break;
    }
}

}   // namespace hostkit
