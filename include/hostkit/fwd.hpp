#pragma once

#include <cstdint>

namespace hostkit
{

// Identifier of a host, unique within its HostManager.
using HostId = uint32_t;

struct Rect;
struct HostConfig;
struct WindowEvent;
struct MouseEvent;
struct ClientState;

class Logger;
class UiScheduler;
class ManualScheduler;
class LoopScheduler;

class BackingWindow;
class BackingEventSink;
class ScaledBackingWindow;

class HostClient;
class Host;
class HostManager;
class HostLifecycleListener;

}   // namespace hostkit
