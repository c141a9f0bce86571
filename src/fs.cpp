#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <sys/stat.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define mkdir(path, mode) _mkdir(path)
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
    #include <dirent.h>
    #include <errno.h>
#endif

namespace skyshare {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFDIR) != 0;
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;
    return create_file_binary(path, content, content ? strlen(content) : 0);
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_ERROR("fs", "Failed to create file: " << path);
        return false;
    }

    if (data && size > 0) {
        size_t written = fwrite(data, 1, size, file);
        fclose(file);

        if (written != size) {
            LOG_ERROR("fs", "Failed to write complete data to file: " << path);
            return false;
        }
    } else {
        fclose(file);
    }

    return true;
}

char* read_file_text(const char* path, size_t* size_out) {
    if (!path) return nullptr;

    size_t size = 0;
    void* data = read_file_binary(path, &size);
    if (!data) {
        return nullptr;
    }

    // Grow by one for the null terminator
    char* buffer = (char*)realloc(data, size + 1);
    if (!buffer) {
        LOG_ERROR("fs", "Failed to allocate memory for file: " << path);
        free(data);
        return nullptr;
    }
    buffer[size] = '\0';

    if (size_out) {
        *size_out = size;
    }
    return buffer;
}

void* read_file_binary(const char* path, size_t* size_out) {
    if (!path || !size_out) return nullptr;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_DEBUG("fs", "Failed to open file for reading: " << path);
        return nullptr;
    }

    fseek(file, 0, SEEK_END);
    long file_size = ftell(file);
    fseek(file, 0, SEEK_SET);

    if (file_size < 0) {
        LOG_ERROR("fs", "Failed to get file size: " << path);
        fclose(file);
        return nullptr;
    }

    // malloc(0) may return null, always ask for at least one byte
    void* buffer = malloc(file_size > 0 ? file_size : 1);
    if (!buffer) {
        LOG_ERROR("fs", "Failed to allocate memory for file: " << path);
        fclose(file);
        return nullptr;
    }

    size_t bytes_read = fread(buffer, 1, file_size, file);
    fclose(file);

    *size_out = bytes_read;
    return buffer;
}

bool create_directories(const char* path) {
    if (!path || !*path) return false;

    if (directory_exists(path)) {
        return true;
    }

    std::string current;
    std::string full(path);
    for (size_t i = 0; i < full.size(); ++i) {
        current += full[i];
        bool separator = full[i] == '/' || full[i] == '\\';
        if ((separator && i > 0) || i + 1 == full.size()) {
            if (!directory_exists(current.c_str()) && mkdir(current.c_str(), 0755) != 0) {
#ifndef _WIN32
                if (errno == EEXIST) continue;
#endif
                LOG_ERROR("fs", "Failed to create directory: " << current);
                return false;
            }
        }
    }
    return true;
}

bool delete_file(const char* path) {
    if (!path) return false;
    return remove(path) == 0;
}

bool list_directory(const char* path, std::vector<DirectoryEntry>& entries) {
    if (!path) return false;
    entries.clear();

#ifdef _WIN32
    std::string pattern = combine_paths(path, "*");
    WIN32_FIND_DATAA find_data;
    HANDLE handle = FindFirstFileA(pattern.c_str(), &find_data);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }
    do {
        std::string name = find_data.cFileName;
        if (name == "." || name == "..") continue;
        DirectoryEntry entry;
        entry.name = name;
        entry.path = combine_paths(path, name);
        entry.is_directory = (find_data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
        entries.push_back(entry);
    } while (FindNextFileA(handle, &find_data));
    FindClose(handle);
#else
    DIR* dir = opendir(path);
    if (!dir) {
        return false;
    }
    struct dirent* item;
    while ((item = readdir(dir)) != nullptr) {
        std::string name = item->d_name;
        if (name == "." || name == "..") continue;
        DirectoryEntry entry;
        entry.name = name;
        entry.path = combine_paths(path, name);
        entry.is_directory = directory_exists(entry.path.c_str());
        entries.push_back(entry);
    }
    closedir(dir);
#endif

    return true;
}

std::string get_file_extension(const char* path) {
    if (!path) return "";
    std::string name = path;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return name.substr(dot);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;
    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

void free_file_buffer(void* buffer) {
    free(buffer);
}

bool read_file_binary_cpp(const std::string& path, std::vector<uint8_t>& out) {
    size_t size = 0;
    void* data = read_file_binary(path.c_str(), &size);
    if (!data) {
        return false;
    }
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    out.assign(bytes, bytes + size);
    free_file_buffer(data);
    return true;
}

} // namespace skyshare
