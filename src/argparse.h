/*
    author: qcisbridge developers
    date:   14 February 2026
*/

#ifndef QCIS_ARGPARSE_h
#define QCIS_ARGPARSE_h

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Command line parsing with a builder:
 *
 *      ARGPARSE()
 *          .required("input-file", "QCIS file to check", input_file)
 *          .optional("-c", "--couplers", "coupler map", couplers, "")
 *          .parse(argc, argv);
 *
 * Supported argument types are std::string, int64_t, double, bool (a flag
 * that takes no value), and std::vector<std::string> (a comma-separated
 * list). Parse errors print the usage string to stderr and throw
 * `std::runtime_error`.
 * */
class ARGPARSE
{
public:
    enum class TYPE_INFO { STRING, INT, FLOAT, FLAG, LIST };

    struct required_argument_type
    {
        std::string_view name;
        std::string_view description;
        void*            ptr;
        TYPE_INFO        type;
    };

    struct optional_argument_type
    {
        std::string_view flag_name{""};  // i.e., '-v'
        std::string_view full_name{""};  // i.e., '--verbose'
        std::string_view description;
        void*            ptr;
        TYPE_INFO        type;
    };
private:
    std::vector<required_argument_type> required_arguments_;
    std::vector<optional_argument_type> optional_arguments_;

    std::stringstream usage_strm_;
    std::stringstream options_strm_;
public:
    ARGPARSE() =default;

    template <class T> ARGPARSE& required(std::string_view name, std::string_view description, T& ref);
    template <class T, class DT> ARGPARSE& optional(std::string_view flag_name,
                                                    std::string_view full_name,
                                                    std::string_view description,
                                                    T& ref,
                                                    DT default_value);
    void parse(int argc, char** argv);
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void read_argument_and_write_to_ptr(const std::string&, void*, ARGPARSE::TYPE_INFO);

std::string_view argparse_type_name(ARGPARSE::TYPE_INFO);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#include "argparse.tpp"

#endif  // QCIS_ARGPARSE_h
