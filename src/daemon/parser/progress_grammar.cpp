#include "daemon/parser/progress_grammar.h"

#include <cerrno>
#include <cstdlib>
#include <regex>

namespace daemon_parser {

namespace {

const std::regex& copyDiskRegex() {
    static const std::regex re(R"(Copying disk (\d+)/(\d+) to)");
    return re;
}

const std::regex& progressRegex() {
    static const std::regex re(R"(^\s+\((\d+\.\d+)/100%\))");
    return re;
}

const std::regex& nbdkitPathRegex() {
    static const std::regex re(R"(^nbdkit: debug: Opening file (.*) \(.*\))");
    return re;
}

const std::regex& overlaySourceRegex() {
    static const std::regex re(R"re(^ *overlay source qemu URI: json:.*"file\.path": ?"([^"]+)")re");
    return re;
}

const std::regex& qemuImgInfoRegex() {
    static const std::regex re(
        R"re(^libguestfs: parse_json: qemu-img info JSON output:.*"backing-filename".*\\"file\.path\\": ?\\"([^"\\]+)\\")re");
    return re;
}

const std::regex& vmIdRegex() {
    static const std::regex re(R"(<VirtualSystem ovf:id='([a-fA-F0-9-]*)'>)");
    return re;
}

const std::regex& displayNameRegex() {
    static const std::regex re(R"re(^displayName = "(.*)"$)re");
    return re;
}

const std::regex& vmdkPathRegex() {
    static const std::regex re(R"(/vmfs/volumes/([^/]*)/([^/]*)/(.*?)(-flat)?\.vmdk$)");
    return re;
}

bool toInt(const std::string& text, int& out) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value < 0 || value > 1000000) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

}  // namespace

std::string VirtV2vGrammar::toDatastorePath(const std::string& path) {
    std::smatch m;
    if (!std::regex_search(path, m, vmdkPathRegex())) {
        return path;
    }
    return m.prefix().str() + "[" + m[1].str() + "] " + m[2].str() + "/" + m[3].str() + ".vmdk";
}

ParsedLine VirtV2vGrammar::classify(const std::string& line) const {
    std::smatch m;

    if (std::regex_search(line, m, copyDiskRegex())) {
        CopyDiskLine copy;
        if (toInt(m[1].str(), copy.index) && toInt(m[2].str(), copy.count) && copy.index > 0) {
            return copy;
        }
        return UnrecognizedLine{line};
    }
    if (std::regex_search(line, m, nbdkitPathRegex())) {
        return DiskPathLine{m[1].str()};
    }
    if (std::regex_search(line, m, overlaySourceRegex()) ||
        std::regex_search(line, m, qemuImgInfoRegex())) {
        return DiskPathLine{toDatastorePath(m[1].str())};
    }
    if (std::regex_search(line, m, progressRegex())) {
        errno = 0;
        char* end = nullptr;
        const std::string text = m[1].str();
        double percent = std::strtod(text.c_str(), &end);
        if (errno != 0 || end == text.c_str()) {
            return UnrecognizedLine{line};
        }
        return ProgressLine{percent};
    }
    if (std::regex_search(line, m, vmIdRegex())) {
        return VmIdLine{m[1].str()};
    }
    if (std::regex_search(line, m, displayNameRegex())) {
        return DisplayNameLine{m[1].str()};
    }
    return UnrecognizedLine{line};
}

std::unique_ptr<ProgressGrammar> makeGrammar(int version) {
    if (version == 0 || version == VirtV2vGrammar::kVersion) {
        return std::make_unique<VirtV2vGrammar>();
    }
    return nullptr;
}

}  // namespace daemon_parser
