#include "external_launcher.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "minifin_log.h"

std::string XdgLauncher::query_scheme_handler(const std::string &scheme) const
{
    if (scheme.empty()) return std::string();
    int fds[2];
    if (pipe(fds) != 0) {
        perror("[minifin] pipe");
        return std::string();
    }
    std::string mime = "x-scheme-handler/" + scheme;
    pid_t pid = fork();
    if (pid < 0) {
        perror("[minifin] fork");
        close(fds[0]);
        close(fds[1]);
        return std::string();
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        close(fds[0]);
        close(fds[1]);
        execlp("xdg-mime", "xdg-mime", "query", "default", mime.c_str(), (char *)NULL);
        _exit(127);
    }
    close(fds[1]);

    std::string output;
    char buf[256];
    while (true) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_ENTER("xdg-mime exited status=%d for %s", status, mime.c_str());
        return std::string();
    }
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r' || output.back() == ' ')) {
        output.pop_back();
    }
    return output;
}

std::string XdgLauncher::handler_for_scheme(const std::string &scheme)
{
    if (scheme.empty()) return std::string();
    auto it = handler_cache_.find(scheme);
    if (it != handler_cache_.end()) return it->second;
    std::string handler = query_scheme_handler(scheme);
    handler_cache_[scheme] = handler;
    return handler;
}

bool XdgLauncher::can_launch(const std::string &uri)
{
    std::string handler = handler_for_scheme(parse_uri_scheme(uri));
    LOG_ENTER("uri=%s handler=%s", uri.c_str(), handler.empty() ? "(none)" : handler.c_str());
    return !handler.empty();
}

bool XdgLauncher::launch(const std::string &uri)
{
    fprintf(stderr, "[minifin] xdg-open %s\n", uri.c_str());
    pid_t pid = fork();
    if (pid < 0) {
        perror("[minifin] fork");
        return false;
    }
    if (pid == 0) {
        // Detach twice so the handler is reparented to init and never
        // needs reaping from the UI loop.
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) _exit(1);
        if (grandchild > 0) _exit(0);
        execlp("xdg-open", "xdg-open", uri.c_str(), (char *)NULL);
        perror("[minifin] execlp xdg-open");
        _exit(127);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}
