#include "core/job_request.h"

#include "core/error_codes.h"

#include <istream>
#include <iterator>

namespace v2v_wrapper {

namespace {

constexpr const char* kMasked = "*****";

using nlohmann::json;

void requireType(const json& j, const char* key, bool ok, const char* expected) {
    if (!ok) {
        throw ValidationError(std::string("\"") + key + "\" must be " + expected + ", got " +
                                  j[key].type_name(),
                              ErrorCode::VALIDATION_INVALID_TYPE);
    }
}

std::string requireString(const json& j, const char* key) {
    if (!j.contains(key)) {
        throw ValidationError(std::string("Missing argument: ") + key,
                              ErrorCode::VALIDATION_MISSING_KEY);
    }
    requireType(j, key, j[key].is_string(), "a string");
    std::string value = j[key].get<std::string>();
    if (value.empty()) {
        throw ValidationError(std::string("\"") + key + "\" must not be empty",
                              ErrorCode::VALIDATION_INVALID_VALUE);
    }
    return value;
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    requireType(j, key, j[key].is_string(), "a string");
    return j[key].get<std::string>();
}

bool optionalBool(const json& j, const char* key, bool defaultValue) {
    if (!j.contains(key) || j[key].is_null()) {
        return defaultValue;
    }
    requireType(j, key, j[key].is_boolean(), "a boolean");
    return j[key].get<bool>();
}

std::vector<std::string> parseSourceDisks(const json& j) {
    std::vector<std::string> disks;
    if (!j.contains("source_disks") || j["source_disks"].is_null()) {
        return disks;
    }
    requireType(j, "source_disks", j["source_disks"].is_array(), "an array");
    for (const auto& item : j["source_disks"]) {
        if (!item.is_string()) {
            throw ValidationError("\"source_disks\" must contain only strings",
                                  ErrorCode::VALIDATION_INVALID_TYPE);
        }
        disks.push_back(item.get<std::string>());
    }
    return disks;
}

std::vector<NetworkMapping> parseNetworkMappings(const json& j) {
    std::vector<NetworkMapping> mappings;
    if (!j.contains("network_mappings") || j["network_mappings"].is_null()) {
        return mappings;
    }
    requireType(j, "network_mappings", j["network_mappings"].is_array(), "an array");
    for (const auto& item : j["network_mappings"]) {
        if (!item.is_object() || !item.contains("source") || !item.contains("destination")) {
            throw ValidationError(
                "Both \"source\" and \"destination\" must be provided in network mapping",
                ErrorCode::VALIDATION_MISSING_KEY);
        }
        NetworkMapping mapping;
        mapping.source = requireString(item, "source");
        mapping.destination = requireString(item, "destination");
        mapping.macAddress = optionalString(item, "mac_address");
        mappings.push_back(std::move(mapping));
    }
    return mappings;
}

RhvUploadTarget parseRhvUpload(const json& j) {
    RhvUploadTarget target;
    target.url = requireString(j, "rhv_url");
    target.cluster = requireString(j, "rhv_cluster");
    target.storage = requireString(j, "rhv_storage");
    target.password = requireString(j, "rhv_password");
    target.caFile = optionalString(j, "rhv_cafile").value_or("");
    target.insecureConnection = optionalBool(j, "insecure_connection", false);
    return target;
}

JobRequest validate(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Job request must be a JSON object",
                              ErrorCode::VALIDATION_INVALID_TYPE);
    }

    JobRequest request;
    request.vmName = requireString(j, "vm_name");

    if (!j.contains("transport_method")) {
        throw ValidationError("No transport method specified", ErrorCode::VALIDATION_MISSING_KEY);
    }
    requireType(j, "transport_method", j["transport_method"].is_string(), "a string");
    const std::string transport = j["transport_method"].get<std::string>();
    auto method = parseTransportMethod(transport);
    if (!method) {
        throw ValidationError("Unknown transport method: " + transport);
    }
    request.transportMethod = *method;

    if (auto format = optionalString(j, "output_format")) {
        auto parsed = parseOutputFormat(*format);
        if (!parsed) {
            throw ValidationError("Invalid output format " + *format + ", expected raw or qcow2");
        }
        request.outputFormat = *parsed;
    }

    if (request.transportMethod == TransportMethod::Vddk) {
        request.vmwareUri = requireString(j, "vmware_uri");
    } else {
        request.vmwareUri = optionalString(j, "vmware_uri").value_or("");
    }
    request.vmwarePassword = optionalString(j, "vmware_password");
    request.vmwareFingerprint = optionalString(j, "vmware_fingerprint");

    request.exportDomain = optionalString(j, "export_domain");
    if (j.contains("rhv_url")) {
        if (request.exportDomain) {
            throw ValidationError("Only one of \"export_domain\" and \"rhv_url\" may be given");
        }
        request.rhvUpload = parseRhvUpload(j);
    }

    if (auto allocation = optionalString(j, "allocation")) {
        auto parsed = parseAllocation(*allocation);
        if (!parsed) {
            throw ValidationError("Invalid allocation " + *allocation +
                                  ", expected sparse or preallocated");
        }
        request.allocation = *parsed;
    }

    request.sourceDisks = parseSourceDisks(j);
    request.networkMappings = parseNetworkMappings(j);

    request.backend = optionalString(j, "backend");
    request.virtioWin = optionalString(j, "virtio_win");
    request.daemonize = optionalBool(j, "daemonize", true);
    request.runAsRoot = optionalBool(j, "run_as_root", false);

    return request;
}

}  // namespace

nlohmann::json JobRequest::redactedJson() const {
    json j;
    j["vm_name"] = vmName;
    j["transport_method"] = transportMethodToString(transportMethod);
    j["output_format"] = outputFormatToString(outputFormat);
    if (!vmwareUri.empty()) {
        j["vmware_uri"] = vmwareUri;
    }
    if (vmwarePassword) {
        j["vmware_password"] = kMasked;
    }
    if (vmwareFingerprint) {
        j["vmware_fingerprint"] = *vmwareFingerprint;
    }
    if (exportDomain) {
        j["export_domain"] = *exportDomain;
    }
    if (rhvUpload) {
        j["rhv_url"] = rhvUpload->url;
        j["rhv_cluster"] = rhvUpload->cluster;
        j["rhv_storage"] = rhvUpload->storage;
        j["rhv_password"] = kMasked;
        if (!rhvUpload->caFile.empty()) {
            j["rhv_cafile"] = rhvUpload->caFile;
        }
        j["insecure_connection"] = rhvUpload->insecureConnection;
    }
    if (allocation) {
        j["allocation"] = allocationToString(*allocation);
    }
    j["source_disks"] = sourceDisks;
    json mappings = json::array();
    for (const auto& mapping : networkMappings) {
        json m = {{"source", mapping.source}, {"destination", mapping.destination}};
        if (mapping.macAddress) {
            m["mac_address"] = *mapping.macAddress;
        }
        mappings.push_back(std::move(m));
    }
    j["network_mappings"] = std::move(mappings);
    if (backend) {
        j["backend"] = *backend;
    }
    if (virtioWin) {
        j["virtio_win"] = *virtioWin;
    }
    j["daemonize"] = daemonize;
    j["run_as_root"] = runAsRoot;
    return j;
}

JobRequest parseJobRequest(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Failed to parse job request: ") + e.what(),
                              ErrorCode::VALIDATION_MALFORMED_JSON);
    }
    return validate(j);
}

JobRequest loadJobRequest(std::istream& input) {
    std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return parseJobRequest(text);
}

const char* outputFormatToString(OutputFormat format) {
    switch (format) {
    case OutputFormat::Qcow2:
        return "qcow2";
    case OutputFormat::Raw:
    default:
        return "raw";
    }
}

const char* transportMethodToString(TransportMethod method) {
    switch (method) {
    case TransportMethod::Ssh:
        return "ssh";
    case TransportMethod::Vddk:
    default:
        return "vddk";
    }
}

const char* allocationToString(Allocation allocation) {
    switch (allocation) {
    case Allocation::Preallocated:
        return "preallocated";
    case Allocation::Sparse:
    default:
        return "sparse";
    }
}

std::optional<OutputFormat> parseOutputFormat(const std::string& str) {
    if (str == "raw") {
        return OutputFormat::Raw;
    }
    if (str == "qcow2") {
        return OutputFormat::Qcow2;
    }
    return std::nullopt;
}

std::optional<TransportMethod> parseTransportMethod(const std::string& str) {
    if (str == "vddk") {
        return TransportMethod::Vddk;
    }
    if (str == "ssh") {
        return TransportMethod::Ssh;
    }
    return std::nullopt;
}

std::optional<Allocation> parseAllocation(const std::string& str) {
    if (str == "sparse") {
        return Allocation::Sparse;
    }
    if (str == "preallocated") {
        return Allocation::Preallocated;
    }
    return std::nullopt;
}

}  // namespace v2v_wrapper
