/*
    author: qcisbridge developers
    date:   17 February 2026
*/

#include "generic_io.h"
#include "check.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace qcis;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

const std::string PROGRAM = "X2P Q01\nB Q01 Q02\nCZ G0201\nB Q01 Q02\nM Q01 Q02\n";

std::string
_temp_path(std::string_view name)
{
    return (std::filesystem::temp_directory_path() / ("qcisbridge_test_" + std::string{name})).string();
}

std::string
_large_program()
{
    // several lzma and read_all chunks worth of text
    std::string out;
    for (int i = 0; i < 20000; i++)
        out += "X2P Q" + std::to_string(i % 100) + "\nB Q01 Q02\n";
    return out;
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_write_then_read(std::string_view suffix, const std::string& contents)
{
    std::string path = _temp_path("prog.qcis" + std::string{suffix});
    generic_strm_write_all(path, contents);
    CHECK(std::filesystem::exists(path));
    CHECK_EQ(generic_strm_read_all(path), contents);
    std::filesystem::remove(path);
}

void
test_compressed_files_are_smaller()
{
    std::string contents = _large_program();
    std::string plain = _temp_path("size.qcis"),
                gz = _temp_path("size.qcis.gz"),
                xz = _temp_path("size.qcis.xz");
    generic_strm_write_all(plain, contents);
    generic_strm_write_all(gz, contents);
    generic_strm_write_all(xz, contents);

    CHECK_EQ(std::filesystem::file_size(plain), contents.size());
    CHECK(std::filesystem::file_size(gz) < contents.size());
    CHECK(std::filesystem::file_size(xz) < contents.size());

    std::filesystem::remove(plain);
    std::filesystem::remove(gz);
    std::filesystem::remove(xz);
}

void
test_missing_file()
{
    std::string path = _temp_path("does_not_exist.qcis");
    CHECK_THROWS_AS(std::runtime_error, generic_strm_read_all(path));
    CHECK_THROWS_AS(std::runtime_error, generic_strm_read_all(path + ".xz"));
}

void
test_lzma_file_mode_is_enforced()
{
    std::string path = _temp_path("mode.qcis.xz");
    generic_strm_type strm;
    generic_strm_open(strm, path, "wb");
    char buf[4];
    CHECK_THROWS_AS(std::runtime_error, generic_strm_read(strm, buf, sizeof(buf)));
    generic_strm_close(strm);
    std::filesystem::remove(path);
}

void
test_failed_reads_release_the_file()
{
    std::string path = _temp_path("garbage.qcis.xz");
    {
        std::ofstream strm(path, std::ios::binary);
        strm << "this is not an xz stream, just plain text\n";
    }

    // more attempts than the usual open-file limit: a leaked handle per
    // failure would turn the decoder error into an open error
    int decode_failures{0};
    for (int i = 0; i < 1500; i++)
    {
        try
        {
            generic_strm_read_all(path);
        }
        catch (const std::runtime_error& e)
        {
            if (std::string{e.what()}.find("lzma_code") != std::string::npos)
                decode_failures++;
        }
    }
    CHECK_EQ(decode_failures, 1500);
    std::filesystem::remove(path);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    test_write_then_read("", PROGRAM);
    test_write_then_read(".gz", PROGRAM);
    test_write_then_read(".xz", PROGRAM);
    test_write_then_read(".xz", _large_program());
    test_write_then_read(".gz", _large_program());
    test_compressed_files_are_smaller();
    test_missing_file();
    test_lzma_file_mode_is_enforced();
    test_failed_reads_release_the_file();
    return test::test_exit_code("test_generic_io");
}
