#include "restbridge/core/routing/uri_template.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/url.hpp"
#include <algorithm>
#include <regex>

namespace restbridge {

    namespace {

        const std::regex& variablePattern() {
            static const std::regex re{ R"(\{([a-zA-Z0-9_-]+)\})" };
            return re;
        }

        const std::regex& queryPairPattern() {
            static const std::regex re{ R"(^([A-Za-z0-9_-]+)=\{([a-zA-Z0-9_-]+)\}$)" };
            return re;
        }

        void rejectStrayBraces(std::string_view literal, const std::string& tmpl) {
            if (literal.find_first_of("{}") != std::string_view::npos)
                throw TemplateError("malformed template variable in \"" + tmpl + "\"");
        }

    }

    /* ---------------- MatchResult ---------------- */

    void MatchResult::add(std::string name, std::string value) {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    void MatchResult::merge(const MatchResult& other) {
        entries_.insert(entries_.end(), other.entries_.begin(), other.entries_.end());
    }

    std::optional<nlohmann::json> MatchResult::get(std::string_view name) const {
        std::vector<std::string> values;
        for (const auto& [k, v] : entries_) {
            if (k == name) values.push_back(v);
        }
        if (values.empty()) return std::nullopt;
        if (values.size() == 1) return nlohmann::json(values.front());
        return nlohmann::json(values);
    }

    std::size_t MatchResult::count(std::string_view name) const {
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
            [&](const auto& e) { return e.first == name; }));
    }

    /* ---------------- UriTemplateMatcher ---------------- */

    UriTemplateMatcher::UriTemplateMatcher(std::string uriTemplate)
        : template_(std::move(uriTemplate))
    {
        auto q = template_.find('?');
        if (q == std::string::npos) {
            compilePath(template_);
            return;
        }
        if (template_.find('?', q + 1) != std::string::npos)
            throw TemplateError("more than one '?' in \"" + template_ + "\"");
        compilePath(template_.substr(0, q));
        compileQuery(template_.substr(q + 1));
    }

    std::string UriTemplateMatcher::makeName(std::string_view name) {
        std::string out{ name };
        std::replace(out.begin(), out.end(), '-', '_');
        return out;
    }

    bool UriTemplateMatcher::hasName(std::string_view name) const {
        return std::find(names_.begin(), names_.end(), name) != names_.end();
    }

    void UriTemplateMatcher::addVariable(const std::string& name) {
        if (hasName(name))
            throw TemplateError("every variable must not be duplicated: " + name);
        names_.push_back(name);
    }

    void UriTemplateMatcher::compilePath(const std::string& pathTemplate) {
        std::size_t lastPos = 0;
        for (auto it = std::sregex_iterator(pathTemplate.begin(), pathTemplate.end(), variablePattern());
             it != std::sregex_iterator(); ++it)
        {
            const auto& m = *it;
            auto literal = std::string_view(pathTemplate).substr(lastPos, m.position(0) - lastPos);
            rejectStrayBraces(literal, template_);
            auto name = makeName(m.str(1));
            addVariable(name);
            pathNames_.push_back(name);
            pathLiterals_.emplace_back(literal);
            lastPos = m.position(0) + m.length(0);
        }
        auto tail = std::string_view(pathTemplate).substr(lastPos);
        rejectStrayBraces(tail, template_);
        pathLiterals_.emplace_back(tail);
    }

    void UriTemplateMatcher::compileQuery(const std::string& queryTemplate) {
        std::size_t pos = 0;
        while (pos < queryTemplate.size()) {
            auto amp = queryTemplate.find('&', pos);
            if (amp == std::string::npos) amp = queryTemplate.size();
            std::string pair = queryTemplate.substr(pos, amp - pos);
            pos = amp + 1;
            if (pair.empty()) continue;

            std::smatch m;
            if (!std::regex_match(pair, m, queryPairPattern()))
                throw TemplateError("malformed query template \"" + pair + "\" in \"" + template_ + "\"");
            auto name = makeName(m.str(2));
            addVariable(name);
            queryPatterns_.push_back(QueryPattern{ m.str(1), std::move(name) });
        }
    }

    bool UriTemplateMatcher::matchFrom(std::string_view path, std::size_t var, std::size_t pos,
                                       std::vector<std::string_view>& captures) const {
        if (var == pathNames_.size()) return pos == path.size();

        // shortest capture first, widened to the next occurrence of the following literal
        const std::string& next = pathLiterals_[var + 1];
        bool last = var + 1 == pathNames_.size();
        std::size_t from = pos + 1;
        while (from <= path.size()) {
            std::size_t end;
            if (last) {
                // the trailing literal must close the path
                if (path.size() < pos + 1 + next.size()) return false;
                end = path.size() - next.size();
                if (path.substr(end) != next) return false;
            }
            else {
                end = path.find(next, from);
                if (end == std::string_view::npos) return false;
            }
            captures[var] = path.substr(pos, end - pos);
            if (matchFrom(path, var + 1, end + next.size(), captures)) return true;
            if (last) return false;
            from = end + 1;
        }
        return false;
    }

    std::optional<MatchResult> UriTemplateMatcher::matchPath(const std::string& path) const {
        std::string_view view{ path };
        const std::string& head = pathLiterals_.front();
        if (view.substr(0, head.size()) != head) return std::nullopt;

        std::vector<std::string_view> captures(pathNames_.size());
        if (!matchFrom(view, 0, head.size(), captures)) return std::nullopt;

        MatchResult result;
        for (std::size_t i = 0; i < pathNames_.size(); ++i)
            result.add(pathNames_[i], percentDecode(captures[i]));
        return result;
    }

    std::optional<MatchResult> UriTemplateMatcher::matchQuery(const std::string& query) const {
        MatchResult result;
        for (const auto& qp : queryPatterns_) {
            bool found = false;
            std::string_view rest{ query };
            for (;;) {
                auto amp = rest.find('&');
                auto pair = rest.substr(0, amp);
                // "key=value" with a non-empty value
                if (pair.size() > qp.key.size() + 1 &&
                    pair.compare(0, qp.key.size(), qp.key) == 0 &&
                    pair[qp.key.size()] == '=')
                {
                    result.add(qp.name, percentDecode(pair.substr(qp.key.size() + 1), true));
                    found = true;
                }
                if (amp == std::string_view::npos) break;
                rest.remove_prefix(amp + 1);
            }
            if (!found) return std::nullopt;
        }
        return result;
    }

}
