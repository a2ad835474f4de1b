#include "lang/Source.hpp"
#include "master/Errors.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace gridflow::lang
{

namespace
{

constexpr int kMaxNesting = 256;

class Reader
{
  public:
    explicit Reader(std::string_view text) : text_(text) {}

    bool at_end()
    {
        skip_blank();
        return pos_ >= text_.size();
    }

    Expr read()
    {
        skip_blank();
        if (pos_ >= text_.size())
            fail("unexpected end of input");

        const char c = text_[pos_];
        if (c == ')')
            fail("unbalanced ')'");
        if (c == '(')
            return read_list();
        return read_atom();
    }

  private:
    [[noreturn]] void fail(const std::string& what) const
    {
        throw ParseError("line " + std::to_string(line_) + ": " + what);
    }

    void skip_blank()
    {
        while (pos_ < text_.size())
        {
            const char c = text_[pos_];
            if (c == '\n')
            {
                ++line_;
                ++pos_;
            }
            else if (std::isspace(static_cast<unsigned char>(c)))
                ++pos_;
            else if (c == ';')
            {
                while (pos_ < text_.size() && text_[pos_] != '\n')
                    ++pos_;
            }
            else
                break;
        }
    }

    Expr read_list()
    {
        Expr e;
        e.kind = Expr::Kind::List;
        e.line = line_;
        if (++depth_ > kMaxNesting)
            fail("forms nested deeper than " + std::to_string(kMaxNesting));
        ++pos_; // '('
        for (;;)
        {
            skip_blank();
            if (pos_ >= text_.size())
                fail("missing ')' for list opened on line " + std::to_string(e.line));
            if (text_[pos_] == ')')
            {
                ++pos_;
                --depth_;
                return e;
            }
            e.items.push_back(read());
        }
    }

    Expr read_atom()
    {
        const std::size_t begin = pos_;
        while (pos_ < text_.size())
        {
            const char c = text_[pos_];
            if (std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')' || c == ';')
                break;
            ++pos_;
        }
        const std::string tok(text_.substr(begin, pos_ - begin));

        Expr e;
        e.line = line_;
        if (tok == "true" || tok == "false")
        {
            e.kind = Expr::Kind::Bool;
            e.boolean = (tok == "true");
            return e;
        }
        if (looks_numeric(tok))
        {
            e.kind = Expr::Kind::Number;
            const char* s = tok.c_str();
            char* end = nullptr;
            e.integral = tok.find_first_of(".eE") == std::string::npos;
            errno = 0;
            if (e.integral)
            {
                e.integer = std::strtoll(s, &end, 10);
                e.number = static_cast<double>(e.integer);
            }
            else
            {
                e.number = std::strtod(s, &end);
            }
            if (end != s + tok.size())
                fail("malformed number '" + tok + "'");
            if (errno == ERANGE)
                fail("number out of range '" + tok + "'");
            return e;
        }
        e.kind = Expr::Kind::Symbol;
        e.symbol = tok;
        return e;
    }

    static bool looks_numeric(const std::string& tok)
    {
        std::size_t i = 0;
        if (tok[0] == '-' || tok[0] == '+')
            i = 1;
        if (i < tok.size() && tok[i] == '.')
            ++i;
        return i < tok.size() && std::isdigit(static_cast<unsigned char>(tok[i]));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int depth_ = 0;
};

Param parse_param(const Expr& p)
{
    Param out;
    out.line = p.line;
    if (p.is_symbol())
    {
        out.name = p.symbol;
        return out;
    }
    if (!p.is_list() || p.items.size() < 2 || !p.items[0].is_symbol() || !p.items[1].is_symbol())
        throw ParseError("line " + std::to_string(p.line) + ": malformed parameter " +
                         p.to_string());
    out.name = p.items[0].symbol;
    out.type = p.items[1].symbol;
    for (std::size_t i = 2; i < p.items.size(); ++i)
    {
        if (!p.items[i].is_symbol())
            throw ParseError("line " + std::to_string(p.line) + ": parameter " + out.name +
                             " has a non-symbol dimension " + p.items[i].to_string());
        out.dims.push_back(p.items[i].symbol);
    }
    return out;
}

} // namespace

std::string Expr::to_string() const
{
    switch (kind)
    {
    case Kind::Symbol:
        return symbol;
    case Kind::Bool:
        return boolean ? "true" : "false";
    case Kind::Number:
    {
        if (integral)
            return std::to_string(integer);
        std::ostringstream os;
        os << number;
        return os.str();
    }
    case Kind::List:
        break;
    }
    std::string s = "(";
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i)
            s += ' ';
        s += items[i].to_string();
    }
    return s + ")";
}

std::vector<Expr> read_forms(std::string_view text)
{
    Reader r(text);
    std::vector<Expr> forms;
    while (!r.at_end())
        forms.push_back(r.read());
    return forms;
}

Expr read_expr(std::string_view text)
{
    auto forms = read_forms(text);
    if (forms.size() != 1)
        throw ParseError("expected exactly one form, got " + std::to_string(forms.size()));
    return std::move(forms.front());
}

Source parse_operator(std::string_view text)
{
    Expr top = read_expr(text);
    if (!top.is_list() || top.items.size() < 4 || !top.items[0].is_symbol("field_operator"))
        throw ParseError("line " + std::to_string(top.line) +
                         ": expected (field_operator name (params...) body...)");
    if (!top.items[1].is_symbol())
        throw ParseError("line " + std::to_string(top.line) + ": operator name must be a symbol");
    if (!top.items[2].is_list())
        throw ParseError("line " + std::to_string(top.items[2].line) +
                         ": parameter list must be a list");

    Source src;
    src.name = top.items[1].symbol;
    src.text = std::string(text);
    for (const auto& p : top.items[2].items)
        src.params.push_back(parse_param(p));
    for (std::size_t i = 3; i < top.items.size(); ++i)
        src.body.push_back(std::move(top.items[i]));
    return src;
}

} // namespace gridflow::lang
