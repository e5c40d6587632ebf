#ifndef UNIQINT_FILE_H_INCLUDED
#define UNIQINT_FILE_H_INCLUDED

#include <cstdio>
#include <string>
#include <vector>

namespace UniqInt {

/**
 * Owning wrapper around a stdio text stream. Every failure is reported as
 * UniqInt::Error of type Io with the file name and errno text.
 */
class File {
protected:
    FILE* file = nullptr;
    std::string fname;

public:
    File() {}
    File(const std::string& fname, const char* mode);

    File(const File&) = delete;
    File(File&& other);

    File& operator=(const File&) = delete;
    File& operator=(File&& other);

    ~File();

    bool inUse() const {
        return file != nullptr;
    }

    void open(const std::string& fname, const char* mode);

    /**
     * Reads the next line without its trailing '\n'. Lines of any length are
     * supported and a last line without newline is returned as well.
     *
     * @return false at end of file
     */
    bool read_line(std::string& line);

    void write(const char* buf, size_t len);
    void write(const std::string& s) { write(s.data(), s.size()); }

    /**
     * Writes every value in decimal followed by '\n'
     */
    void write_lines(const std::vector<int>& values);

    /**
     * Closes the stream, reporting buffered write failures. The destructor
     * closes silently instead.
     */
    void close();

protected:
    void assert_usage() const;
};

bool file_exists(const std::string& path);
bool is_regular_file(const std::string& path);
bool is_directory(const std::string& path);

/**
 * Creates path and all its missing parents, like mkdir -p
 *
 * @throws Error of type Io
 */
void make_dirs(const std::string& path);

/**
 * Names of the entries of a directory, without "." and ".."
 *
 * @throws Error of type Io
 */
std::vector<std::string> list_dir(const std::string& path);

std::string join_path(const std::string& dir, const std::string& name);

bool ends_with(const std::string& s, const std::string& tail);

} // namespace UniqInt

#endif // UNIQINT_FILE_H_INCLUDED
