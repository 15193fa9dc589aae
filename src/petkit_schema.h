#pragma once

#include "phi/adapter/sdk/sidecar.h"

namespace phicore::petkit::ipc {

inline constexpr const char kPluginType[] = "petkit";
inline constexpr const char kExecutableName[] = "phi_adapter_petkit_ipc";

// Host socket: first positional argument, then the environment, then this.
inline constexpr const char kSocketPathEnv[] = "PHI_ADAPTER_SOCKET_PATH";
inline constexpr const char kDefaultSocketPath[] = "/tmp/phi-adapter-petkit-ipc.sock";

inline constexpr const char kActionProbe[] = "probe";
inline constexpr const char kActionRefresh[] = "refresh";

phicore::adapter::v1::Utf8String displayName();
phicore::adapter::v1::Utf8String description();
phicore::adapter::v1::Utf8String iconSvg();

phicore::adapter::v1::AdapterCapabilities capabilities();
phicore::adapter::v1::JsonText configSchemaJson();

} // namespace phicore::petkit::ipc
