#ifndef V2V_WRAPPER_CONSTANTS_H
#define V2V_WRAPPER_CONSTANTS_H

// Common constants shared across wrapper components

namespace WrapperConstants {

constexpr const char* WRAPPER_VERSION = "1.0.0";

// Defaults for WrapperConfig
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/v2v-wrapper/config.json";
constexpr const char* DEFAULT_VIRT_V2V_PATH = "/usr/bin/virt-v2v";
constexpr const char* DEFAULT_LOG_DIR = "/var/log/vdsm/import";
constexpr const char* DEFAULT_STATE_DIR = "/tmp";
constexpr const char* DEFAULT_LOCAL_OUTPUT_DIR = "/var/tmp";
constexpr const char* DEFAULT_VDDK_LIBDIR = "/opt/vmware-vix-disklib-distrib";
constexpr const char* DEFAULT_SERVICE_ACCOUNT = "vdsm";
constexpr const char* DEFAULT_RHV_CAFILE = "/etc/pki/vdsm/certs/cacert.pem";
constexpr int DEFAULT_PERSIST_INTERVAL_MS = 5000;
constexpr const char* DEFAULT_VDSM_MOUNTS_DIR = "/rhev/data-center/mnt";

// Host checks
constexpr const char* MIN_RHV_VERSION = "4.2.4";
constexpr const char* MIN_VDSM_VERSION = "4.20.31";  // must match MIN_RHV_VERSION
constexpr const char* ISO_DOMAIN_IMAGE_ID = "11111111-1111-1111-1111-111111111111";

// virt-v2v feature that allows --mac network mappings
constexpr const char* CAPABILITY_MAC_OPTION = "mac-option";

// Output file naming: <dir>/v2v-import-<tag><suffix>
constexpr const char* OUTPUT_PREFIX = "v2v-import-";
constexpr const char* V2V_LOG_SUFFIX = ".log";
constexpr const char* MACHINE_READABLE_LOG_SUFFIX = "-mr.log";
constexpr const char* WRAPPER_LOG_SUFFIX = "-wrapper.log";
constexpr const char* STATE_FILE_SUFFIX = ".state";

// Output loop
constexpr int OUTPUT_POLL_TIMEOUT_MS = 1000;
constexpr int OUTPUT_READ_CHUNK = 4096;

// Exit status when the conversion failed and the wrapper stayed in the foreground
constexpr int FOREGROUND_FAILURE_EXIT = 2;

}  // namespace WrapperConstants

#endif  // V2V_WRAPPER_CONSTANTS_H
