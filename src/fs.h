#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>

namespace skyshare {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);

// File creation and writing
bool create_file(const char* path, const char* content);
bool create_file_binary(const char* path, const void* data, size_t size);

// File reading
char* read_file_text(const char* path, size_t* size_out = nullptr);
void* read_file_binary(const char* path, size_t* size_out);

// Directory operations
bool create_directories(const char* path); // Create parent directories if needed

// File operations
bool delete_file(const char* path);

// Directory listing
struct DirectoryEntry {
    std::string name;
    std::string path;
    bool is_directory;
};
bool list_directory(const char* path, std::vector<DirectoryEntry>& entries);

// Path utilities
std::string get_file_extension(const char* path);
std::string combine_paths(const std::string& base, const std::string& relative);

// Utility functions
void free_file_buffer(void* buffer); // Free memory allocated by read functions

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file_binary(path.c_str(), content.data(), content.size());
}
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline std::string read_file_text_cpp(const std::string& path) {
    size_t size;
    char* content = read_file_text(path.c_str(), &size);
    if (!content) return "";
    std::string result(content, size);
    free_file_buffer(content);
    return result;
}

/**
 * Read a whole file into a byte vector.
 * @return false if the file cannot be opened
 */
bool read_file_binary_cpp(const std::string& path, std::vector<uint8_t>& out);

} // namespace skyshare
