#include "hermes/template_engine.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace hermes
{
    namespace
    {
        // ---- compiled representation --------------------------------------

        struct PathExpr
        {
            std::string text;                  // as written, for messages
            std::size_t up{0};                 // number of leading ../
            bool root{false};                  // @root
            std::string data_var;              // index, key, first, last
            std::vector<std::string> segments; // empty means the context itself
        };

        struct Expression
        {
            std::string helper; // empty for plain lookups
            std::vector<PathExpr> params;
            std::string text;
        };

        enum class NodeKind
        {
            Text,
            Variable,
            Block
        };

        enum class BlockKind
        {
            If,
            Unless,
            Each,
            With
        };

        struct Node
        {
            NodeKind kind{NodeKind::Text};
            std::string text;
            Expression expr;
            bool escape{true};
            BlockKind block{BlockKind::If};
            std::vector<Node> body;
            std::vector<Node> inverse;
        };

        // ---- tokenizer ----------------------------------------------------

        struct Token
        {
            bool is_tag{false};
            bool triple{false};
            bool strip_before{false};
            bool strip_after{false};
            bool comment{false};
            std::string content;
            std::size_t offset{0};
        };

        std::string trim(std::string_view s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return std::string(s.substr(begin, end - begin + 1));
        }

        std::string where(const std::string &source, std::size_t offset)
        {
            auto line = 1 + std::count(source.begin(), source.begin() + static_cast<std::ptrdiff_t>(offset), '\n');
            return "line " + std::to_string(line);
        }

        Result<std::vector<Token>> tokenize(const std::string &src)
        {
            std::vector<Token> tokens;
            std::size_t pos = 0;
            while (pos < src.size())
            {
                auto open = src.find("{{", pos);
                if (open == std::string::npos)
                {
                    tokens.push_back(Token{false, false, false, false, false, src.substr(pos), pos});
                    break;
                }
                if (open > pos)
                    tokens.push_back(Token{false, false, false, false, false, src.substr(pos, open - pos), pos});

                Token tag;
                tag.is_tag = true;
                tag.offset = open;

                std::size_t start = open + 2;
                bool tilde_open = start < src.size() && src[start] == '~';
                std::size_t probe = tilde_open ? start + 1 : start;

                if (src.compare(probe, 3, "!--") == 0)
                {
                    auto close = src.find("--", probe + 3);
                    while (close != std::string::npos &&
                           !(src.compare(close + 2, 2, "}}") == 0 || src.compare(close + 2, 3, "~}}") == 0))
                        close = src.find("--", close + 1);
                    if (close == std::string::npos)
                        return std::unexpected(HermesError::template_compile("unterminated comment at " + where(src, open)));
                    tag.comment = true;
                    tag.strip_before = tilde_open;
                    tag.strip_after = src[close + 2] == '~';
                    pos = close + (tag.strip_after ? 5 : 4);
                    tokens.push_back(std::move(tag));
                    continue;
                }

                tag.triple = src.compare(probe, 1, "{") == 0;
                if (tag.triple)
                    ++probe;
                const std::string close_seq = tag.triple ? "}}}" : "}}";
                auto close = src.find(close_seq, probe);
                if (close == std::string::npos)
                    return std::unexpected(HermesError::template_compile("unterminated tag at " + where(src, open)));

                std::string content = src.substr(probe, close - probe);
                pos = close + close_seq.size();

                tag.strip_before = tilde_open;
                if (!content.empty() && content.back() == '~')
                {
                    tag.strip_after = true;
                    content.pop_back();
                }
                tag.content = trim(content);
                if (tag.content.empty())
                    return std::unexpected(HermesError::template_compile("empty tag at " + where(src, open)));
                if (!tag.triple && tag.content.front() == '!')
                    tag.comment = true;
                tokens.push_back(std::move(tag));
            }

            // whitespace control: {{~ trims the text before, ~}} the text after
            for (std::size_t i = 0; i < tokens.size(); ++i)
            {
                if (!tokens[i].is_tag)
                    continue;
                if (tokens[i].strip_before && i > 0 && !tokens[i - 1].is_tag)
                {
                    auto &t = tokens[i - 1].content;
                    t.erase(t.find_last_not_of(" \t\r\n") + 1);
                }
                if (tokens[i].strip_after && i + 1 < tokens.size() && !tokens[i + 1].is_tag)
                {
                    auto &t = tokens[i + 1].content;
                    t.erase(0, std::min(t.find_first_not_of(" \t\r\n"), t.size()));
                }
            }
            return tokens;
        }

        // ---- expressions --------------------------------------------------

        Result<PathExpr> parse_path(const std::string &text)
        {
            PathExpr path;
            path.text = text;
            std::string_view s = text;

            while (s.substr(0, 3) == "../")
            {
                ++path.up;
                s.remove_prefix(3);
            }

            if (s.substr(0, 5) == "@root")
            {
                path.root = true;
                s.remove_prefix(5);
                if (!s.empty() && (s.front() == '.' || s.front() == '/'))
                    s.remove_prefix(1);
                else if (!s.empty())
                    return std::unexpected(HermesError::template_compile("invalid path expression '" + text + "'"));
            }
            else if (!s.empty() && s.front() == '@')
            {
                auto name = std::string(s.substr(1));
                if (name != "index" && name != "key" && name != "first" && name != "last")
                    return std::unexpected(HermesError::template_compile("unknown data variable '@" + name + "'"));
                path.data_var = name;
                return path;
            }

            if (s == "this" || s == ".")
                return path;
            if (s.substr(0, 5) == "this." || s.substr(0, 5) == "this/")
                s.remove_prefix(5);
            else if (s.substr(0, 2) == "./")
                s.remove_prefix(2);

            if (s.empty())
            {
                if (path.root)
                    return path;
                return std::unexpected(HermesError::template_compile("invalid path expression '" + text + "'"));
            }

            std::string segment;
            bool bracket = false;
            for (std::size_t i = 0; i < s.size(); ++i)
            {
                char c = s[i];
                if (bracket)
                {
                    if (c == ']')
                        bracket = false;
                    else
                        segment += c;
                    continue;
                }
                if (c == '[')
                {
                    bracket = true;
                    continue;
                }
                if (c == '.' || c == '/')
                {
                    if (segment.empty())
                        return std::unexpected(HermesError::template_compile("invalid path expression '" + text + "'"));
                    path.segments.push_back(std::move(segment));
                    segment.clear();
                    continue;
                }
                segment += c;
            }
            if (bracket || segment.empty())
                return std::unexpected(HermesError::template_compile("invalid path expression '" + text + "'"));
            path.segments.push_back(std::move(segment));
            return path;
        }

        std::vector<std::string> split_words(const std::string &content)
        {
            std::vector<std::string> words;
            std::string current;
            bool bracket = false; // [segment literals] may contain spaces
            for (char c : content)
            {
                if (c == '[')
                    bracket = true;
                else if (c == ']')
                    bracket = false;

                if (!bracket && std::isspace(static_cast<unsigned char>(c)))
                {
                    if (!current.empty())
                        words.push_back(std::move(current));
                    current.clear();
                }
                else
                {
                    current += c;
                }
            }
            if (!current.empty())
                words.push_back(std::move(current));
            return words;
        }

        Result<Expression> parse_expression(const std::string &content)
        {
            Expression expr;
            expr.text = content;
            auto words = split_words(content);
            if (words.empty())
                return std::unexpected(HermesError::template_compile("empty expression"));

            std::size_t first_param = 0;
            if (words.size() > 1)
            {
                expr.helper = words[0];
                first_param = 1;
            }
            for (std::size_t i = first_param; i < words.size(); ++i)
            {
                auto path = parse_path(words[i]);
                if (!path)
                    return std::unexpected(path.error());
                expr.params.push_back(std::move(*path));
            }
            if (expr.helper == "json" && expr.params.size() != 1)
                return std::unexpected(HermesError::template_compile("helper 'json' takes exactly one parameter"));
            return expr;
        }

        std::optional<BlockKind> block_kind(const std::string &name)
        {
            if (name == "if")
                return BlockKind::If;
            if (name == "unless")
                return BlockKind::Unless;
            if (name == "each")
                return BlockKind::Each;
            if (name == "with")
                return BlockKind::With;
            return std::nullopt;
        }

        // ---- parser -------------------------------------------------------

        struct OpenBlock
        {
            BlockKind kind;
            std::string name;
            Expression expr;
            std::vector<Node> body;
            std::vector<Node> inverse;
            bool in_inverse{false};
            std::size_t offset{0};
        };

        Result<std::vector<Node>> parse(const std::string &src, std::vector<Token> tokens)
        {
            std::vector<Node> root;
            std::vector<OpenBlock> open;

            auto current = [&]() -> std::vector<Node> & {
                if (open.empty())
                    return root;
                return open.back().in_inverse ? open.back().inverse : open.back().body;
            };

            for (auto &tok : tokens)
            {
                if (!tok.is_tag)
                {
                    if (!tok.content.empty())
                    {
                        Node n;
                        n.kind = NodeKind::Text;
                        n.text = std::move(tok.content);
                        current().push_back(std::move(n));
                    }
                    continue;
                }
                if (tok.comment)
                    continue;

                const std::string &c = tok.content;
                auto fail = [&](const std::string &msg) {
                    return std::unexpected(HermesError::template_compile(msg + " at " + where(src, tok.offset)));
                };

                if (tok.triple || c.front() == '&')
                {
                    auto expr = parse_expression(tok.triple ? c : trim(c.substr(1)));
                    if (!expr)
                        return fail(expr.error().what());
                    Node n;
                    n.kind = NodeKind::Variable;
                    n.expr = std::move(*expr);
                    n.escape = false;
                    current().push_back(std::move(n));
                    continue;
                }

                if (c.front() == '#' || (c.front() == '^' && c.size() > 1))
                {
                    OpenBlock block{};
                    block.offset = tok.offset;
                    auto words = split_words(c.substr(1));
                    if (c.front() == '^')
                    {
                        // mustache inverted section: {{^name}}...{{/name}}
                        if (words.size() != 1)
                            return fail("inverted section takes exactly one path");
                        block.kind = BlockKind::Unless;
                        block.name = words[0];
                    }
                    else
                    {
                        if (words.empty())
                            return fail("block tag without a helper name");
                        auto kind = block_kind(words[0]);
                        if (!kind)
                            return fail("unknown block helper '" + words[0] + "'");
                        if (words.size() < 2)
                            return fail("block helper '" + words[0] + "' requires a parameter");
                        if (words.size() > 2)
                            return fail("block helper '" + words[0] + "' takes exactly one parameter");
                        block.kind = *kind;
                        block.name = words[0];
                        words.erase(words.begin());
                    }
                    auto path = parse_path(words[0]);
                    if (!path)
                        return fail(path.error().what());
                    block.expr.text = words[0];
                    block.expr.params.push_back(std::move(*path));
                    open.push_back(std::move(block));
                    continue;
                }

                if (c.front() == '/')
                {
                    auto name = trim(c.substr(1));
                    if (open.empty())
                        return fail("unexpected closing tag {{/" + name + "}}");
                    if (open.back().name != name)
                        return fail("mismatched closing tag: expected {{/" + open.back().name + "}} but found {{/" + name + "}}");
                    OpenBlock block = std::move(open.back());
                    open.pop_back();
                    Node n;
                    n.kind = NodeKind::Block;
                    n.block = block.kind;
                    n.expr = std::move(block.expr);
                    n.body = std::move(block.body);
                    n.inverse = std::move(block.inverse);
                    current().push_back(std::move(n));
                    continue;
                }

                if (c == "else" || c == "^")
                {
                    if (open.empty() || open.back().in_inverse)
                        return fail("unexpected {{else}}");
                    open.back().in_inverse = true;
                    continue;
                }
                if (c.rfind("else ", 0) == 0)
                    return fail("chained {{else ...}} is not supported");

                if (c.front() == '>')
                    return fail("partials are not supported");

                auto expr = parse_expression(c);
                if (!expr)
                    return fail(expr.error().what());
                Node n;
                n.kind = NodeKind::Variable;
                n.expr = std::move(*expr);
                current().push_back(std::move(n));
            }

            if (!open.empty())
            {
                return std::unexpected(HermesError::template_compile(
                    "unclosed block {{#" + open.back().name + "}} opened at " + where(src, open.back().offset)));
            }
            return root;
        }

        // ---- rendering ----------------------------------------------------

        void escape_into(std::string &out, std::string_view s)
        {
            for (char c : s)
            {
                switch (c)
                {
                case '&':
                    out += "&amp;";
                    break;
                case '<':
                    out += "&lt;";
                    break;
                case '>':
                    out += "&gt;";
                    break;
                case '"':
                    out += "&quot;";
                    break;
                case '\'':
                    out += "&#x27;";
                    break;
                case '`':
                    out += "&#x60;";
                    break;
                case '=':
                    out += "&#x3D;";
                    break;
                default:
                    out += c;
                }
            }
        }

        std::string stringify(const nlohmann::json &v)
        {
            switch (v.type())
            {
            case nlohmann::json::value_t::string:
                return v.get_ref<const std::string &>();
            case nlohmann::json::value_t::null:
            case nlohmann::json::value_t::discarded:
                return {};
            case nlohmann::json::value_t::boolean:
                return v.get<bool>() ? "true" : "false";
            case nlohmann::json::value_t::array:
            {
                std::string out = "[";
                bool first = true;
                for (const auto &item : v)
                {
                    if (!first)
                        out += ", ";
                    out += stringify(item);
                    first = false;
                }
                out += "]";
                return out;
            }
            case nlohmann::json::value_t::object:
                return "[object]";
            default:
                return v.dump();
            }
        }

        bool truthy(const nlohmann::json *v)
        {
            if (!v)
                return false;
            switch (v->type())
            {
            case nlohmann::json::value_t::null:
            case nlohmann::json::value_t::discarded:
                return false;
            case nlohmann::json::value_t::boolean:
                return v->get<bool>();
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
            case nlohmann::json::value_t::number_float:
                return v->get<double>() != 0.0;
            case nlohmann::json::value_t::string:
            case nlohmann::json::value_t::array:
            case nlohmann::json::value_t::object:
                return !v->empty();
            default:
                return true;
            }
        }

        struct Frame
        {
            const nlohmann::json *context{nullptr};
            bool loop{false};
            std::size_t index{0};
            std::string key;
            bool has_key{false};
            bool first{false};
            bool last{false};
        };

        class Renderer
        {
        public:
            Renderer(const nlohmann::json &root, const std::string &name, bool strict)
                : root_(root), name_(name), strict_(strict)
            {
                frames_.push_back(Frame{&root_});
            }

            Result<void> render(const std::vector<Node> &nodes)
            {
                for (const auto &node : nodes)
                {
                    Result<void> res;
                    switch (node.kind)
                    {
                    case NodeKind::Text:
                        out_ += node.text;
                        break;
                    case NodeKind::Variable:
                        res = render_variable(node);
                        break;
                    case NodeKind::Block:
                        res = render_block(node);
                        break;
                    }
                    if (!res)
                        return res;
                }
                return {};
            }

            std::string take() { return std::move(out_); }

        private:
            HermesError error(const std::string &msg) const
            {
                return HermesError::template_render("Error rendering \"" + name_ + "\": " + msg);
            }

            // Resolves a path; data variables are materialized into `scratch`.
            const nlohmann::json *resolve(const PathExpr &path, nlohmann::json &scratch) const
            {
                if (path.up >= frames_.size())
                    return nullptr;
                const Frame &frame = frames_[frames_.size() - 1 - path.up];

                if (!path.data_var.empty())
                {
                    if (!frame.loop)
                        return nullptr;
                    if (path.data_var == "index")
                        scratch = frame.index;
                    else if (path.data_var == "key")
                    {
                        if (!frame.has_key)
                            return nullptr;
                        scratch = frame.key;
                    }
                    else if (path.data_var == "first")
                        scratch = frame.first;
                    else
                        scratch = frame.last;
                    return &scratch;
                }

                const nlohmann::json *cur = path.root ? &root_ : frame.context;
                for (const auto &seg : path.segments)
                {
                    if (!cur)
                        return nullptr;
                    if (cur->is_object())
                    {
                        auto it = cur->find(seg);
                        cur = it == cur->end() ? nullptr : &*it;
                    }
                    else if (cur->is_array() && !seg.empty() &&
                             std::all_of(seg.begin(), seg.end(), [](unsigned char ch) { return std::isdigit(ch); }))
                    {
                        std::size_t idx = 0;
                        auto [end, ec] = std::from_chars(seg.data(), seg.data() + seg.size(), idx);
                        // indexes too large for size_t are simply absent
                        if (ec != std::errc{} || end != seg.data() + seg.size())
                            cur = nullptr;
                        else
                            cur = idx < cur->size() ? &(*cur)[idx] : nullptr;
                    }
                    else
                    {
                        cur = nullptr;
                    }
                }
                return cur;
            }

            Result<void> render_variable(const Node &node)
            {
                const Expression &expr = node.expr;
                if (!expr.helper.empty() && expr.helper != "json")
                    return std::unexpected(error("Helper not defined: " + expr.helper));

                nlohmann::json scratch;
                const nlohmann::json *value = resolve(expr.params.front(), scratch);
                if (!value && strict_)
                    return std::unexpected(error("Variable \"" + expr.params.front().text + "\" not found in strict mode"));

                if (expr.helper == "json")
                {
                    out_ += value ? value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) : "null";
                    return {};
                }
                if (!value)
                    return {};

                auto text = stringify(*value);
                if (node.escape)
                    escape_into(out_, text);
                else
                    out_ += text;
                return {};
            }

            Result<void> render_block(const Node &node)
            {
                const PathExpr &param = node.expr.params.front();
                nlohmann::json scratch;
                const nlohmann::json *value = resolve(param, scratch);

                switch (node.block)
                {
                case BlockKind::If:
                    return render(truthy(value) ? node.body : node.inverse);
                case BlockKind::Unless:
                    return render(truthy(value) ? node.inverse : node.body);
                case BlockKind::With:
                {
                    if (!value && strict_)
                        return std::unexpected(error("Variable \"" + param.text + "\" not found in strict mode"));
                    if (!truthy(value))
                        return render(node.inverse);
                    // `value` may point into scratch; keep a stable copy for the frame
                    nlohmann::json held = value == &scratch ? scratch : nlohmann::json();
                    frames_.push_back(Frame{value == &scratch ? &held : value});
                    auto res = render(node.body);
                    frames_.pop_back();
                    return res;
                }
                case BlockKind::Each:
                    return render_each(node, param, value);
                }
                return {};
            }

            Result<void> render_each(const Node &node, const PathExpr &param, const nlohmann::json *value)
            {
                if (!value && strict_)
                    return std::unexpected(error("Variable \"" + param.text + "\" not found in strict mode"));
                if (!value || !truthy(value))
                    return render(node.inverse);

                if (value->is_array())
                {
                    const std::size_t n = value->size();
                    for (std::size_t i = 0; i < n; ++i)
                    {
                        Frame f{&(*value)[i], true, i};
                        f.first = i == 0;
                        f.last = i + 1 == n;
                        frames_.push_back(std::move(f));
                        auto res = render(node.body);
                        frames_.pop_back();
                        if (!res)
                            return res;
                    }
                    return {};
                }

                if (value->is_object())
                {
                    const std::size_t n = value->size();
                    std::size_t i = 0;
                    for (auto it = value->begin(); it != value->end(); ++it, ++i)
                    {
                        Frame f{&it.value(), true, i};
                        f.key = it.key();
                        f.has_key = true;
                        f.first = i == 0;
                        f.last = i + 1 == n;
                        frames_.push_back(std::move(f));
                        auto res = render(node.body);
                        frames_.pop_back();
                        if (!res)
                            return res;
                    }
                    return {};
                }

                return std::unexpected(error("Param type is not iterable: \"" + param.text + "\""));
            }

            const nlohmann::json &root_;
            const std::string &name_;
            bool strict_;
            std::vector<Frame> frames_;
            std::string out_;
        };

    } // namespace

    struct MustacheRenderer::Template
    {
        std::string name;
        std::vector<Node> nodes;
    };

    MustacheRenderer::MustacheRenderer(RenderOptions options) : options_(options) {}

    MustacheRenderer::~MustacheRenderer() = default;

    Result<TemplateHandle> MustacheRenderer::compile(const std::string &name, const std::string &source)
    {
        auto tokens = tokenize(source);
        if (!tokens)
            return std::unexpected(tokens.error());
        auto nodes = parse(source, std::move(*tokens));
        if (!nodes)
            return std::unexpected(nodes.error());

        auto tmpl = std::make_unique<Template>();
        tmpl->name = name;
        tmpl->nodes = std::move(*nodes);
        templates_.push_back(std::move(tmpl));
        return TemplateHandle{templates_.size() - 1, name};
    }

    Result<std::string> MustacheRenderer::render(const TemplateHandle &handle, const nlohmann::json &data) const
    {
        if (handle.id >= templates_.size() || templates_[handle.id]->name != handle.name)
            return std::unexpected(HermesError::template_render("Template not found: " + handle.name));

        const Template &tmpl = *templates_[handle.id];
        Renderer renderer(data, tmpl.name, options_.strict);
        if (auto res = renderer.render(tmpl.nodes); !res)
            return std::unexpected(res.error());
        return renderer.take();
    }

    nlohmann::json to_template_data(nlohmann::json value)
    {
        if (value.is_object())
            return value;
        nlohmann::json wrapped = nlohmann::json::object();
        wrapped["data"] = std::move(value);
        return wrapped;
    }

} // namespace hermes
