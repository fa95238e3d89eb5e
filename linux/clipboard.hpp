#pragma once

#include <flow/orchestrator.hpp>

#include <optional>
#include <string>
#include <vector>

namespace clipboard {

// Output of a helper process, nullopt if it could not run, timed out or failed
std::optional<std::string> run(const std::vector<std::string>& argv, const std::string& input, int timeout_ms,
                               size_t max_output);

// Desktop clipboard through wl-paste/wl-copy, falling back to xclip
class SystemClipboard : public juhradial::flow::Clipboard {
public:
    explicit SystemClipboard(size_t max_size, int timeout_ms = 2000);

    std::optional<std::string> read() override;
    bool write(const std::string& text) override;

private:
    size_t max_size_;
    int timeout_ms_;
};

} // namespace clipboard
