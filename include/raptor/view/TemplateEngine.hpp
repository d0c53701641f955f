#pragma once

#include "raptor/view/Presenter.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace raptor::view {

class TemplateEngine {
public:
    virtual ~TemplateEngine() = default;

    virtual std::string render(const Presenter& presenter,
                               std::string_view resourceName,
                               std::string_view templateName) const = 0;
};

// Reads <root>/<resource>/<template>.html on every render.
class FileTemplateEngine : public TemplateEngine {
public:
    explicit FileTemplateEngine(std::filesystem::path root);

    std::string render(const Presenter& presenter,
                       std::string_view resourceName,
                       std::string_view templateName) const override;

    std::filesystem::path templatePath(std::string_view resourceName, std::string_view templateName) const;

private:
    std::filesystem::path root_;
};

} // namespace raptor::view
