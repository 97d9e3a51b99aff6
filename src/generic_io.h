/*
    author: qcisbridge developers
    date:   14 February 2026
*/

#ifndef QCIS_GENERIC_IO_h
#define QCIS_GENERIC_IO_h

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <variant>

#include <lzma.h>
#include <zlib.h>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * xz support. An LZMA_FILE is opened either for reading (decoder) or for
 * writing (encoder), never both.
 * */
class LZMA_FILE
{
public:
    enum class MODE { READ, WRITE };
private:
    constexpr static size_t   LZMA_BUF_SIZE{4096};
    constexpr static uint32_t LZMA_PRESET{6};

    lzma_stream lzma_strm_;
    FILE*       file_strm_;
    MODE        mode_;
    uint8_t     lzma_buf_[LZMA_BUF_SIZE];

    bool is_open_{true};
    bool stream_end_{false};
public:
    LZMA_FILE(FILE*, MODE);
    ~LZMA_FILE();

    size_t read(void*, size_t);
    void   write(const void*, size_t);
    bool   eof() const;
    void   close();
private:
    void read_chunk_from_file();
    void write_chunk_to_file();
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

using generic_strm_type = std::variant<FILE*, gzFile, LZMA_FILE*>;

enum class GENERIC_STRM_TYPE_ID { FILE, GZ, XZ };

/*
 * The stream type is picked from the file extension (".gz", ".xz", or
 * anything else for a plain file). `mode` is an fopen mode ("rb", "wb").
 * Throws `std::runtime_error` if the file cannot be opened.
 * */
void   generic_strm_open(generic_strm_type&, const std::string& file_path, const std::string& mode);
size_t generic_strm_read(generic_strm_type&, void* buf, size_t size);
void   generic_strm_write(generic_strm_type&, const void* buf, size_t size);
void   generic_strm_close(generic_strm_type&);

// whole-file helpers used by the tools
std::string generic_strm_read_all(const std::string& file_path);
void        generic_strm_write_all(const std::string& file_path, std::string_view contents);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_GENERIC_IO_h
