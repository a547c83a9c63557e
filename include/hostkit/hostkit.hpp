#pragma once

#include <hostkit/backing_window.hpp>
#include <hostkit/fwd.hpp>
#include <hostkit/host.hpp>
#include <hostkit/host_config.hpp>
#include <hostkit/host_manager.hpp>
#include <hostkit/logger.hpp>
#include <hostkit/rect.hpp>
#include <hostkit/scaled_backing_window.hpp>
#include <hostkit/ui_scheduler.hpp>
#include <hostkit/window_event.hpp>
