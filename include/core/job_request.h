#ifndef V2V_WRAPPER_JOB_REQUEST_H
#define V2V_WRAPPER_JOB_REQUEST_H

#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace v2v_wrapper {

enum class OutputFormat { Raw, Qcow2 };

enum class TransportMethod { Vddk, Ssh };

enum class Allocation { Sparse, Preallocated };

struct NetworkMapping {
    std::string source;
    std::string destination;
    std::optional<std::string> macAddress;
};

// Upload through the oVirt/RHV imageio endpoint (-o rhv-upload)
struct RhvUploadTarget {
    std::string url;
    std::string cluster;
    std::string storage;
    std::string password;
    std::string caFile;  // empty = configured default
    bool insecureConnection = false;
};

/**
 * @brief Conversion job as read from standard input.
 *
 * Immutable once loaded. Secrets (passwords) are kept in memory only
 * until they are written to secret files; redactedJson() is what gets logged.
 */
struct JobRequest {
    std::string vmName;
    TransportMethod transportMethod = TransportMethod::Vddk;
    OutputFormat outputFormat = OutputFormat::Raw;

    // Source connection
    std::string vmwareUri;
    std::optional<std::string> vmwarePassword;
    std::optional<std::string> vmwareFingerprint;

    // Output target: export domain, rhv-upload, or local directory when both are empty
    std::optional<std::string> exportDomain;
    std::optional<RhvUploadTarget> rhvUpload;
    std::optional<Allocation> allocation;

    std::vector<std::string> sourceDisks;
    std::vector<NetworkMapping> networkMappings;

    std::optional<std::string> backend;
    std::optional<std::string> virtioWin;

    bool daemonize = true;
    bool runAsRoot = false;

    // The original JSON with secrets masked
    nlohmann::json redactedJson() const;
};

/**
 * @brief Parse and validate one JSON document.
 *
 * @throws ValidationError on malformed JSON, missing or mistyped keys and
 *         unknown enum values
 */
JobRequest parseJobRequest(const std::string& text);

/**
 * @brief Read exactly one JSON document from the stream and validate it.
 *
 * @throws ValidationError as parseJobRequest
 */
JobRequest loadJobRequest(std::istream& input);

// Conversions to the values virt-v2v and the state file use
const char* outputFormatToString(OutputFormat format);
const char* transportMethodToString(TransportMethod method);
const char* allocationToString(Allocation allocation);

std::optional<OutputFormat> parseOutputFormat(const std::string& str);
std::optional<TransportMethod> parseTransportMethod(const std::string& str);
std::optional<Allocation> parseAllocation(const std::string& str);

}  // namespace v2v_wrapper

#endif  // V2V_WRAPPER_JOB_REQUEST_H
