/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <cctype>

#include <fmt/format.h>

#include <gnoigen/errors.h>
#include <gnoigen/yang_parser.h>

namespace gnoigen
{
    namespace yang_parser
    {
        namespace
        {
            enum class token_type
            {
                STRING,
                QUOTED_STRING,
                LEFT_BRACE,
                RIGHT_BRACE,
                SEMICOLON,
                END
            };

            struct token
            {
                token_type type = token_type::END;
                std::string text;
                int line = 0;
            };

            class lexer
            {
                const std::string& text_;
                const std::string& source_;
                size_t pos_ = 0;
                int line_ = 1;
                bool has_peeked_ = false;
                token peeked_;

            public:
                lexer(const std::string& text, const std::string& source)
                    : text_(text)
                    , source_(source)
                {
                }

                token next()
                {
                    if (has_peeked_)
                    {
                        has_peeked_ = false;
                        return peeked_;
                    }
                    return read_token();
                }

                const token& peek()
                {
                    if (!has_peeked_)
                    {
                        peeked_ = read_token();
                        has_peeked_ = true;
                    }
                    return peeked_;
                }

                [[noreturn]] void fail(int line, const std::string& message) const
                {
                    throw parse_error(fmt::format("{}:{}: {}", source_, line, message));
                }

            private:
                bool at(size_t offset, char c) const { return pos_ + offset < text_.size() && text_[pos_ + offset] == c; }

                void skip_whitespace_and_comments()
                {
                    while (pos_ < text_.size())
                    {
                        char c = text_[pos_];
                        if (c == '\n')
                        {
                            line_++;
                            pos_++;
                        }
                        else if (std::isspace(static_cast<unsigned char>(c)))
                        {
                            pos_++;
                        }
                        else if (c == '/' && at(1, '/'))
                        {
                            while (pos_ < text_.size() && text_[pos_] != '\n')
                                pos_++;
                        }
                        else if (c == '/' && at(1, '*'))
                        {
                            int start_line = line_;
                            pos_ += 2;
                            while (pos_ < text_.size() && !(text_[pos_] == '*' && at(1, '/')))
                            {
                                if (text_[pos_] == '\n')
                                    line_++;
                                pos_++;
                            }
                            if (pos_ >= text_.size())
                                fail(start_line, "unterminated comment");
                            pos_ += 2;
                        }
                        else
                            return;
                    }
                }

                token read_token()
                {
                    skip_whitespace_and_comments();

                    token tok;
                    tok.line = line_;
                    if (pos_ >= text_.size())
                    {
                        tok.type = token_type::END;
                        return tok;
                    }

                    char c = text_[pos_];
                    switch (c)
                    {
                    case '{':
                        pos_++;
                        tok.type = token_type::LEFT_BRACE;
                        return tok;
                    case '}':
                        pos_++;
                        tok.type = token_type::RIGHT_BRACE;
                        return tok;
                    case ';':
                        pos_++;
                        tok.type = token_type::SEMICOLON;
                        return tok;
                    case '"':
                        tok.type = token_type::QUOTED_STRING;
                        tok.text = read_double_quoted();
                        return tok;
                    case '\'':
                        tok.type = token_type::QUOTED_STRING;
                        tok.text = read_single_quoted();
                        return tok;
                    default:
                        tok.type = token_type::STRING;
                        tok.text = read_unquoted();
                        return tok;
                    }
                }

                std::string read_double_quoted()
                {
                    int start_line = line_;
                    std::string ret;
                    pos_++;
                    while (pos_ < text_.size() && text_[pos_] != '"')
                    {
                        char c = text_[pos_];
                        if (c == '\\' && pos_ + 1 < text_.size())
                        {
                            char escaped = text_[pos_ + 1];
                            switch (escaped)
                            {
                            case 'n':
                                ret += '\n';
                                break;
                            case 't':
                                ret += '\t';
                                break;
                            case '"':
                                ret += '"';
                                break;
                            case '\\':
                                ret += '\\';
                                break;
                            default:
                                ret += '\\';
                                ret += escaped;
                                break;
                            }
                            pos_ += 2;
                            continue;
                        }
                        if (c == '\n')
                            line_++;
                        ret += c;
                        pos_++;
                    }
                    if (pos_ >= text_.size())
                        fail(start_line, "unterminated string");
                    pos_++;
                    return ret;
                }

                std::string read_single_quoted()
                {
                    int start_line = line_;
                    size_t start = ++pos_;
                    while (pos_ < text_.size() && text_[pos_] != '\'')
                    {
                        if (text_[pos_] == '\n')
                            line_++;
                        pos_++;
                    }
                    if (pos_ >= text_.size())
                        fail(start_line, "unterminated string");
                    return text_.substr(start, pos_++ - start);
                }

                std::string read_unquoted()
                {
                    size_t start = pos_;
                    while (pos_ < text_.size())
                    {
                        char c = text_[pos_];
                        if (std::isspace(static_cast<unsigned char>(c)) || c == ';' || c == '{' || c == '}')
                            break;
                        if (c == '/' && (at(1, '/') || at(1, '*')))
                            break;
                        pos_++;
                    }
                    return text_.substr(start, pos_ - start);
                }
            };

            std::shared_ptr<statement> parse_statement(lexer& lex)
            {
                token keyword = lex.next();
                if (keyword.type != token_type::STRING)
                    lex.fail(keyword.line, "expected a statement keyword");

                std::string arg;
                token tok = lex.next();
                if (tok.type == token_type::STRING || tok.type == token_type::QUOTED_STRING)
                {
                    arg = tok.text;
                    if (tok.type == token_type::QUOTED_STRING)
                    {
                        // "abc" + "def"
                        while (lex.peek().type == token_type::STRING && lex.peek().text == "+")
                        {
                            lex.next();
                            token more = lex.next();
                            if (more.type != token_type::QUOTED_STRING)
                                lex.fail(more.line, "expected a quoted string after '+'");
                            arg += more.text;
                        }
                    }
                    tok = lex.next();
                }

                auto stmt = std::make_shared<statement>(keyword.text, arg, keyword.line);
                if (tok.type == token_type::SEMICOLON)
                    return stmt;
                if (tok.type != token_type::LEFT_BRACE)
                    lex.fail(tok.line, fmt::format("expected ';' or '{{' after \"{}\"", keyword.text));

                while (lex.peek().type != token_type::RIGHT_BRACE)
                {
                    if (lex.peek().type == token_type::END)
                        lex.fail(keyword.line, fmt::format("missing '}}' for \"{}\"", keyword.text));
                    auto sub = parse_statement(lex);
                    sub->set_parent(stmt.get());
                    sub->set_lexical_parent(stmt.get());
                    stmt->add_substatement(std::move(sub));
                }
                lex.next();
                return stmt;
            }
        }

        std::shared_ptr<statement> parse(const std::string& text, const std::string& source_name)
        {
            lexer lex(text, source_name);
            auto root = parse_statement(lex);
            const token& trailing = lex.peek();
            if (trailing.type != token_type::END)
                lex.fail(trailing.line, "unexpected text after the top level statement");
            return root;
        }
    }
}
