#pragma once

#include <memory>
#include <string>
#include <variant>

namespace daemon_parser {

// "Copying disk N/M to ..." (index is 1-based as printed)
struct CopyDiskLine {
    int index = 0;
    int count = 0;
};

struct DiskPathLine {
    std::string path;
};

struct ProgressLine {
    double percent = 0.0;
};

struct VmIdLine {
    std::string uuid;
};

struct DisplayNameLine {
    std::string name;
};

struct UnrecognizedLine {
    std::string text;
};

using ParsedLine = std::variant<UnrecognizedLine, CopyDiskLine, DiskPathLine, ProgressLine,
                                VmIdLine, DisplayNameLine>;

/**
 * @brief Classifies one line of conversion output.
 *
 * Implementations are stateless; tracking which disk is being copied is the
 * job of ProgressParser. A new virt-v2v output format is supported by adding a
 * grammar with a higher version() rather than editing an existing one.
 */
class ProgressGrammar {
   public:
    virtual ~ProgressGrammar() = default;

    virtual int version() const = 0;
    virtual const char* name() const = 0;

    // Never throws: anything that does not match is an UnrecognizedLine
    virtual ParsedLine classify(const std::string& line) const = 0;
};

class VirtV2vGrammar : public ProgressGrammar {
   public:
    static constexpr int kVersion = 1;

    int version() const override {
        return kVersion;
    }
    const char* name() const override {
        return "virt-v2v";
    }
    ParsedLine classify(const std::string& line) const override;

    // /vmfs/volumes/<store>/<vm>/<disk>[-flat].vmdk -> "[<store>] <vm>/<disk>.vmdk".
    // Other paths are returned unchanged.
    static std::string toDatastorePath(const std::string& path);
};

// Grammar for the given version, or nullptr when unknown. 0 selects the latest.
std::unique_ptr<ProgressGrammar> makeGrammar(int version = 0);

}  // namespace daemon_parser
