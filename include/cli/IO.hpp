#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bob::cli {

struct IO {
    virtual ~IO() = default;
    virtual void print(std::string_view s) = 0;
    virtual bool confirm(std::string_view prompt, bool def_no) = 0;

    // nullopt when nothing was answered before the timeout.
    virtual std::optional<bool> confirmWithin(std::string_view prompt, std::chrono::seconds timeout) = 0;

    // Index of the chosen item, nullopt when aborted.
    virtual std::optional<size_t> select(std::string_view prompt, const std::vector<std::string>& items) = 0;
    virtual std::vector<size_t> multiSelect(std::string_view prompt, const std::vector<std::string>& items) = 0;

    // True when a person can answer prompts.
    [[nodiscard]] virtual bool interactive() const = 0;
};

class TerminalIO final : public IO {
public:
    void print(std::string_view msg) override;
    bool confirm(std::string_view promptIn, bool def_no) override;
    std::optional<bool> confirmWithin(std::string_view promptIn, std::chrono::seconds timeout) override;
    std::optional<size_t> select(std::string_view promptIn, const std::vector<std::string>& items) override;
    std::vector<size_t> multiSelect(std::string_view promptIn, const std::vector<std::string>& items) override;
    [[nodiscard]] bool interactive() const override;

private:
    static std::optional<std::string> readLine(std::optional<std::chrono::seconds> timeout);
    static void listItems(std::string_view promptIn, const std::vector<std::string>& items);
};

}
