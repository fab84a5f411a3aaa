#ifndef MINIFIN_URL_VALIDATOR_H
#define MINIFIN_URL_VALIDATOR_H

#include <string>

enum class UrlProblem {
    None,
    MissingUrl,
    MissingProtocol,
    Malformed,
};

struct UrlValidation {
    bool valid = false;
    UrlProblem problem = UrlProblem::MissingUrl;
    // Short machine-oriented cause: "missing URL", "missing protocol",
    // "malformed URL". Empty when valid.
    std::string reason;
    // The input with surrounding whitespace removed.
    std::string url;
};

std::string trim_whitespace(const std::string &input);

// Accepts absolute http(s) URLs that CEF's URL parser accepts and that
// name a host. Needs libcef loaded in the calling process.
UrlValidation validate_server_url(const std::string &input);

// Text shown on the configure screen for a failed validation.
const char *url_problem_message(UrlProblem problem);

#endif // MINIFIN_URL_VALIDATOR_H
