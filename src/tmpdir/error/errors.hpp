#pragma once

#include <filesystem>
#include <ostream>
#include <string>

namespace tmpdir {

/**
 * @brief Secure deletion was requested, but the external wipe program could not be found.
 *
 * The value is the name of the program that was searched for.
 */
struct e_capability_unavailable {
    std::string value;
};

/**
 * @brief An archive compression/container name was not recognized
 */
struct e_unsupported_format {
    std::string value;
};

/**
 * @brief An archive member path resolved to a location outside of the sandbox root.
 *
 * The value is the member path exactly as it was recorded in the archive.
 */
struct e_path_traversal {
    std::string value;
};

/// A sandbox display name that is not a single path element
struct e_invalid_display_name {
    std::string value;
};

/// The root directory against which a member path was being resolved
struct e_sandbox_root {
    std::filesystem::path value;
};

/**
 * @brief An erase strategy could not finish destroying the given path
 */
struct e_deletion_failed {
    std::filesystem::path value;

    friend std::ostream& operator<<(std::ostream& out, const e_deletion_failed& self) noexcept {
        out << "e_deletion_failed: Failed to destroy [" << self.value.string() << "]";
        return out;
    }
};

/// The exit status of the external wipe program, when it exits non-zero
struct e_wipe_exit_status {
    int value;
};

/// A deletion policy name given by a user was not one of the known names
struct e_invalid_deletion_policy {
    std::string value;
};

/**
 * @brief A failure reported by the archive library while reading or writing a stream
 */
struct e_archive_error {
    std::string value;
};

/// The path of the archive member being processed when an error occurred
struct e_archive_member {
    std::string value;
};

}  // namespace tmpdir
