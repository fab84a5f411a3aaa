#include "url_validator.h"

#include <cstddef>

#include <include/cef_parser.h>

static bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool starts_with_nocase(const std::string &text, const char *prefix)
{
    size_t i = 0;
    for (; prefix[i]; ++i) {
        if (i >= text.size()) return false;
        char c = text[i];
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        if (c != prefix[i]) return false;
    }
    return true;
}

std::string trim_whitespace(const std::string &input)
{
    size_t begin = 0;
    size_t end = input.size();
    while (begin < end && is_space(input[begin])) begin++;
    while (end > begin && is_space(input[end - 1])) end--;
    return input.substr(begin, end - begin);
}

static bool is_url_parseable(const std::string &url)
{
    if (url.empty()) return false;
    CefURLParts parts;
    CefString cef_url(url);
    if (!CefParseURL(cef_url, parts)) return false;
    return !CefString(&parts.host).empty();
}

UrlValidation validate_server_url(const std::string &input)
{
    UrlValidation result;
    result.url = trim_whitespace(input);
    if (result.url.empty()) {
        result.problem = UrlProblem::MissingUrl;
        result.reason = "missing URL";
        return result;
    }
    if (!starts_with_nocase(result.url, "http://") && !starts_with_nocase(result.url, "https://")) {
        result.problem = UrlProblem::MissingProtocol;
        result.reason = "missing protocol";
        return result;
    }
    if (!is_url_parseable(result.url)) {
        result.problem = UrlProblem::Malformed;
        result.reason = "malformed URL";
        return result;
    }
    result.valid = true;
    result.problem = UrlProblem::None;
    return result;
}

const char *url_problem_message(UrlProblem problem)
{
    switch (problem) {
        case UrlProblem::None: return "";
        case UrlProblem::MissingUrl: return "Please enter a server URL";
        case UrlProblem::MissingProtocol: return "URL must start with http:// or https://";
        case UrlProblem::Malformed: return "Please enter a valid URL";
    }
    return "Please enter a valid URL";
}
