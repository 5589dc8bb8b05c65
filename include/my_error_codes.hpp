// Auto-generated from error_codes.ini
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int JSON_PARSE_ERROR = 5021;  // JSON parse error
}  // namespace GENERAL

namespace CONFIG {  // Configuration and preflight errors

constexpr int MISSING_REQUIRED = 5300;  // Required configuration value missing
constexpr int INVALID_VALUE = 5301;  // Configuration value malformed
constexpr int MISSING_COMMAND = 5302;  // Required command not found on PATH
constexpr int NOT_ROOT = 5303;  // Elevated privileges required
}  // namespace CONFIG

namespace KEYS {  // Key material errors

constexpr int RETRIEVAL_FAILED = 5400;  // Public key could not be obtained
constexpr int GENERATION_FAILED = 5401;  // Key generation failed
constexpr int MALFORMED_KEY = 5402;  // Key is not 32 bytes of base64
}  // namespace KEYS

namespace RENDER {  // Rendering errors

constexpr int UNSAFE_VALUE = 5500;  // Value cannot be embedded safely
constexpr int TEMPLATE_PLACEHOLDER = 5501;  // Placeholder left unsubstituted
}  // namespace RENDER

namespace REMOTE {  // Remote channel errors

constexpr int CHANNEL_UNREACHABLE = 5600;  // ssh/scp could not reach the host
constexpr int COMMAND_FAILED = 5601;  // Remote command exited non-zero
constexpr int TRANSFER_FAILED = 5602;  // scp transfer failed
constexpr int UNEXPECTED_OUTPUT = 5603;  // Remote output not understood
}  // namespace REMOTE

namespace TUNNEL {  // Local tunnel errors

constexpr int APPLY_FAILED = 5700;  // wg-quick up failed
constexpr int CONFIG_WRITE_FAILED = 5701;  // Interface config not written
}  // namespace TUNNEL

namespace CONTROL {  // Control errors

constexpr int CANCELLED = 999998;  // Operation cancelled by signal
constexpr int NOT_AN_ERROR = 999999;  // Not an error
}  // namespace CONTROL

}  // namespace my_errors
