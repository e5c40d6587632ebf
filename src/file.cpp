#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>

#include <uniqint/error.h>
#include <uniqint/file.h>

namespace UniqInt {

File::File(const std::string& fname, const char* mode) {
    open(fname, mode);
}

File::File(File&& other)
    : file(other.file)
    , fname(std::move(other.fname)) {
    other.file = nullptr;
}

File& File::operator=(File&& other) {
    if (this != &other) {
        if (file != nullptr) {
            fclose(file);
        }
        file = other.file;
        fname = std::move(other.fname);
        other.file = nullptr;
    }
    return *this;
}

File::~File() {
    if (file != nullptr) {
        fclose(file);
    }
}

void File::open(const std::string& fname, const char* mode) {
    if (file != nullptr) {
        throw Error(ErrorType::Io, "This instance of File is already in use by '" + this->fname + "'");
    }

    FILE* f = fopen(fname.c_str(), mode);
    if (f == nullptr) {
        std::ostringstream os;
        os << "Failed to open file '" << fname << "' with mode '" << mode << "'";
        throw Error(ErrorType::Io, errno_message(os.str()));
    }

    this->file = f;
    this->fname = fname;
}

bool File::read_line(std::string& line) {
    assert_usage();
    line.clear();

    // getc keeps embedded '\0' bytes inside the line they belong to
    bool got = false;
    int c;
    while ((c = getc(file)) != EOF) {
        got = true;
        if (c == '\n') {
            return true;
        }
        line.push_back(static_cast<char>(c));
    }

    if (ferror(file)) {
        throw Error(ErrorType::Io, errno_message("Failed to read from file '" + fname + "'"));
    }
    return got;
}

void File::write(const char* buf, size_t len) {
    assert_usage();
    size_t wrtcnt = fwrite(buf, 1, len, file);
    if (wrtcnt != len) {
        std::ostringstream os;
        os << "Failed to write " << len - wrtcnt << " bytes to file '" << fname << "'";
        throw Error(ErrorType::Io, errno_message(os.str()));
    }
}

void File::write_lines(const std::vector<int>& values) {
    std::string out;
    for (int value : values) {
        out += std::to_string(value);
        out += '\n';
    }
    write(out);
}

void File::close() {
    if (file == nullptr) {
        return;
    }

    FILE* f = file;
    file = nullptr;
    if (fclose(f) != 0) {
        throw Error(ErrorType::Io, errno_message("Failed to close file '" + fname + "'"));
    }
}

void File::assert_usage() const {
    if (file == nullptr) {
        throw Error(ErrorType::Io, "Open the File instance before using it");
    }
}

bool file_exists(const std::string& path) {
    struct stat buf;
    return stat(path.c_str(), &buf) == 0;
}

bool is_regular_file(const std::string& path) {
    struct stat buf;
    return stat(path.c_str(), &buf) == 0 && S_ISREG(buf.st_mode);
}

bool is_directory(const std::string& path) {
    struct stat buf;
    return stat(path.c_str(), &buf) == 0 && S_ISDIR(buf.st_mode);
}

void make_dirs(const std::string& path) {
    if (path.empty() || is_directory(path)) {
        return;
    }

    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        make_dirs(path.substr(0, slash));
    }

    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        throw Error(ErrorType::Io, errno_message("Failed to create directory '" + path + "'"));
    }
    if (!is_directory(path)) {
        throw Error(ErrorType::Io, "'" + path + "' exists and is not a directory");
    }
}

std::vector<std::string> list_dir(const std::string& path) {
    DIR* dir = opendir(path.c_str());
    if (dir == nullptr) {
        throw Error(ErrorType::Io, errno_message("Failed to open directory '" + path + "'"));
    }

    std::vector<std::string> names;
    for (;;) {
        errno = 0;
        struct dirent* ent = readdir(dir);
        if (ent == nullptr) {
            break;
        }
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) {
            continue;
        }
        names.push_back(ent->d_name);
    }
    int errnum = errno;
    closedir(dir);

    if (errnum != 0) {
        throw Error(ErrorType::Io, errno_message("Failed to list directory '" + path + "'", errnum));
    }
    return names;
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir[dir.size() - 1] == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

bool ends_with(const std::string& s, const std::string& tail) {
    return s.size() >= tail.size() && s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

} // namespace UniqInt
