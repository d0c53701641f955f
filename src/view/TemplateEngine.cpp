#include "raptor/view/TemplateEngine.hpp"
#include "raptor/core/Errors.hpp"
#include "raptor/view/TemplateRenderer.hpp"

#include <fstream>
#include <iterator>
#include <utility>

namespace raptor::view {

FileTemplateEngine::FileTemplateEngine(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path FileTemplateEngine::templatePath(std::string_view resourceName,
                                                       std::string_view templateName) const {
    return root_ / std::string(resourceName) / (std::string(templateName) + ".html");
}

std::string FileTemplateEngine::render(const Presenter& presenter,
                                       std::string_view resourceName,
                                       std::string_view templateName) const {
    auto path = templatePath(resourceName, templateName);
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw TemplateNotFound(path.string());
    }
    std::string source((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return TemplateRenderer(source).render(presenter.fields());
}

} // namespace raptor::view
