/*
    author: qcisbridge developers
    date:   11 February 2026

    Interface between the flex descriptor scanner (descriptor.l) and the
    bison descriptor parser (descriptor.y).
*/

#ifndef QCIS_EXT_DESCRIPTOR_LEXER_h
#define QCIS_EXT_DESCRIPTOR_LEXER_h

#if !defined(yyFlexLexerOnce)
#include <FlexLexer.h>
#endif

#include <iostream>
#include <string>
#include <string_view>

#include "descriptor.tab.h"

#undef  YY_DECL
#define YY_DECL int qcis::DESCRIPTOR_LEXER::yylex(yy::parser::value_type* yylval)

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

class DESCRIPTOR_LEXER : public yyFlexLexer
{
private:
    // original text, kept for error messages
    const std::string_view input_;
    size_t                 pos_{0};
public:
    DESCRIPTOR_LEXER(std::istream& _yyin, std::string_view input)
        :yyFlexLexer(_yyin, std::cerr),
        input_(input)
    {}

    using yyFlexLexer::yylex;
    int yylex(yy::parser::value_type* yylval);

    std::string_view input() const { return input_; }
private:
    int read_integer(yy::parser::value_type*);
    int read_float(yy::parser::value_type*);
    int read_string(yy::parser::value_type*);

    [[noreturn]] void error(const std::string& msg) const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_EXT_DESCRIPTOR_LEXER_h
