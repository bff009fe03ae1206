#pragma once

#include <string>
#include <sys/types.h>

namespace v2v_wrapper {

// Password or key material handed to virt-v2v through a file instead of argv.
// The file is mode 0600, owned by the identity virt-v2v runs as, and removed
// when the object is destroyed.
class SecretFile {
   public:
    // Throws SpawnError(SPAWN_SECRET_FILE_FAILED) when the file cannot be written.
    static SecretFile create(const std::string& directory, const std::string& content, uid_t uid,
                             gid_t gid);

    SecretFile(const SecretFile&) = delete;
    SecretFile& operator=(const SecretFile&) = delete;

    SecretFile(SecretFile&& other) noexcept;
    SecretFile& operator=(SecretFile&& other) noexcept;

    ~SecretFile();

    const std::string& path() const;

   private:
    explicit SecretFile(std::string path);

    void remove() noexcept;

    std::string path_;
};

}  // namespace v2v_wrapper
