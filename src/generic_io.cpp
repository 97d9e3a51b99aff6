/*
    author: qcisbridge developers
    date:   14 February 2026
*/

#include "generic_io.h"

#include <limits>
#include <memory>
#include <stdexcept>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

bool
_ends_with(const std::string& s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix) == 0;
}

constexpr size_t READ_ALL_CHUNK_SIZE{1 << 16};

/*
 * Releases a stream left open by an exception. Nothing buffered is
 * flushed, so a partially written file is left truncated.
 * */
struct STREAM_GUARD
{
    generic_strm_type& strm;
    bool               released{false};

    ~STREAM_GUARD()
    {
        if (released)
            return;
        if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::FILE))
            fclose(std::get<FILE*>(strm));
        else if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::GZ))
            gzclose(std::get<gzFile>(strm));
        else
            delete std::get<LZMA_FILE*>(strm);
    }

    void
    close()
    {
        // the stream is gone even if closing it throws
        released = true;
        generic_strm_close(strm);
    }
};

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

LZMA_FILE::LZMA_FILE(FILE* file_strm, MODE mode)
    :file_strm_(file_strm),
    mode_(mode)
{
    lzma_strm_ = LZMA_STREAM_INIT;
    lzma_ret r;
    if (mode_ == MODE::READ)
        r = lzma_stream_decoder(&lzma_strm_, std::numeric_limits<uint64_t>::max(), LZMA_CONCATENATED);
    else
        r = lzma_easy_encoder(&lzma_strm_, LZMA_PRESET, LZMA_CHECK_CRC64);

    if (r != LZMA_OK)
    {
        fclose(file_strm_);
        throw std::runtime_error("LZMA_FILE: failed to initialize lzma stream: error code " + std::to_string(r));
    }

    if (mode_ == MODE::READ)
    {
        read_chunk_from_file();
    }
    else
    {
        lzma_strm_.next_out = lzma_buf_;
        lzma_strm_.avail_out = LZMA_BUF_SIZE;
    }
}

LZMA_FILE::~LZMA_FILE()
{
    // an unclosed writer loses its unflushed data
    if (is_open_)
    {
        lzma_end(&lzma_strm_);
        fclose(file_strm_);
    }
}

size_t
LZMA_FILE::read(void* buf, size_t size)
{
    if (mode_ != MODE::READ)
        throw std::runtime_error("LZMA_FILE::read: file was opened for writing");

    lzma_strm_.next_out = static_cast<uint8_t*>(buf);
    lzma_strm_.avail_out = size;

    while (lzma_strm_.avail_out > 0 && !stream_end_)
    {
        if (lzma_strm_.avail_in == 0 && !feof(file_strm_))
            read_chunk_from_file();
        lzma_ret r = lzma_code(&lzma_strm_, feof(file_strm_) ? LZMA_FINISH : LZMA_RUN);
        if (r == LZMA_STREAM_END)
        {
            stream_end_ = true;
            break;
        }
        if (r != LZMA_OK)
            throw std::runtime_error("LZMA_FILE::read: lzma_code failed: error code " + std::to_string(r));
    }

    return size - lzma_strm_.avail_out;
}

void
LZMA_FILE::write(const void* buf, size_t size)
{
    if (mode_ != MODE::WRITE)
        throw std::runtime_error("LZMA_FILE::write: file was opened for reading");

    lzma_strm_.next_in = static_cast<const uint8_t*>(buf);
    lzma_strm_.avail_in = size;
    while (lzma_strm_.avail_in > 0)
    {
        lzma_ret r = lzma_code(&lzma_strm_, LZMA_RUN);
        if (r != LZMA_OK)
            throw std::runtime_error("LZMA_FILE::write: lzma_code failed: error code " + std::to_string(r));
        if (lzma_strm_.avail_out == 0)
            write_chunk_to_file();
    }
}

bool
LZMA_FILE::eof() const
{
    // the decoder may still hold output after the file is drained
    return stream_end_;
}

void
LZMA_FILE::close()
{
    if (!is_open_)
        return;

    if (mode_ == MODE::WRITE)
    {
        // drain the encoder:
        lzma_ret r;
        do
        {
            r = lzma_code(&lzma_strm_, LZMA_FINISH);
            if (r != LZMA_OK && r != LZMA_STREAM_END)
                throw std::runtime_error("LZMA_FILE::close: lzma_code failed: error code " + std::to_string(r));
            if (lzma_strm_.avail_out == 0 || r == LZMA_STREAM_END)
                write_chunk_to_file();
        }
        while (r != LZMA_STREAM_END);
    }

    lzma_end(&lzma_strm_);
    fclose(file_strm_);
    is_open_ = false;
}

void
LZMA_FILE::read_chunk_from_file()
{
    size_t bytes_read = fread(lzma_buf_, 1, LZMA_BUF_SIZE, file_strm_);
    lzma_strm_.next_in = lzma_buf_;
    lzma_strm_.avail_in = bytes_read;
}

void
LZMA_FILE::write_chunk_to_file()
{
    size_t bytes = LZMA_BUF_SIZE - lzma_strm_.avail_out;
    if (fwrite(lzma_buf_, 1, bytes, file_strm_) != bytes)
        throw std::runtime_error("LZMA_FILE: failed to write compressed data");
    lzma_strm_.next_out = lzma_buf_;
    lzma_strm_.avail_out = LZMA_BUF_SIZE;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
generic_strm_open(generic_strm_type& strm, const std::string& file_path, const std::string& mode)
{
    if (_ends_with(file_path, ".gz"))
    {
        gzFile f = gzopen(file_path.c_str(), mode.c_str());
        if (f == nullptr)
            throw std::runtime_error("generic_strm_open: failed to open gzip file: " + file_path);
        strm = f;
    }
    else if (_ends_with(file_path, ".xz"))
    {
        FILE* f = fopen(file_path.c_str(), mode.c_str());
        if (f == nullptr)
            throw std::runtime_error("generic_strm_open: failed to open xz file: " + file_path);
        auto lzma_mode = (mode.find('w') != std::string::npos || mode.find('a') != std::string::npos)
                            ? LZMA_FILE::MODE::WRITE
                            : LZMA_FILE::MODE::READ;
        strm = new LZMA_FILE(f, lzma_mode);
    }
    else
    {
        FILE* f = fopen(file_path.c_str(), mode.c_str());
        if (f == nullptr)
            throw std::runtime_error("generic_strm_open: failed to open file: " + file_path);
        strm = f;
    }
}

size_t
generic_strm_read(generic_strm_type& strm, void* buf, size_t size)
{
    if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::FILE))
    {
        return fread(buf, 1, size, std::get<FILE*>(strm));
    }
    else if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::GZ))
    {
        int n = gzread(std::get<gzFile>(strm), buf, static_cast<unsigned>(size));
        if (n < 0)
            throw std::runtime_error("generic_strm_read: gzread failed");
        return static_cast<size_t>(n);
    }
    else
    {
        return std::get<LZMA_FILE*>(strm)->read(buf, size);
    }
}

void
generic_strm_write(generic_strm_type& strm, const void* buf, size_t size)
{
    if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::FILE))
    {
        if (fwrite(buf, 1, size, std::get<FILE*>(strm)) != size)
            throw std::runtime_error("generic_strm_write: fwrite failed");
    }
    else if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::GZ))
    {
        if (size > 0 && gzwrite(std::get<gzFile>(strm), buf, static_cast<unsigned>(size)) == 0)
            throw std::runtime_error("generic_strm_write: gzwrite failed");
    }
    else
    {
        std::get<LZMA_FILE*>(strm)->write(buf, size);
    }
}

void
generic_strm_close(generic_strm_type& strm)
{
    if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::FILE))
    {
        fclose(std::get<FILE*>(strm));
    }
    else if (strm.index() == static_cast<size_t>(GENERIC_STRM_TYPE_ID::GZ))
    {
        gzclose(std::get<gzFile>(strm));
    }
    else
    {
        std::unique_ptr<LZMA_FILE> f(std::get<LZMA_FILE*>(strm));
        f->close();
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string
generic_strm_read_all(const std::string& file_path)
{
    generic_strm_type strm;
    generic_strm_open(strm, file_path, "rb");
    STREAM_GUARD guard{strm};

    std::string out;
    std::string chunk(READ_ALL_CHUNK_SIZE, '\0');
    while (true)
    {
        size_t n = generic_strm_read(strm, chunk.data(), chunk.size());
        if (n == 0)
            break;
        out.append(chunk, 0, n);
    }

    guard.close();
    return out;
}

void
generic_strm_write_all(const std::string& file_path, std::string_view contents)
{
    generic_strm_type strm;
    generic_strm_open(strm, file_path, "wb");
    STREAM_GUARD guard{strm};
    generic_strm_write(strm, contents.data(), contents.size());
    guard.close();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
