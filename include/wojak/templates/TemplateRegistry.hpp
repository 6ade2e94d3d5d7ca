#pragma once

#include "wojak/templates/TemplateManifest.hpp"
#include "wojak/templates/TemplateTypes.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace wojak {
namespace templates {

/**
 * @brief Read-only set of templates, loaded once and shared between requests
 *
 * Load order is listing order: manifest entries first, then image files the
 * manifest does not name (sorted by file name). Without a manifest the
 * built-in templates are used. Missing assets are replaced by placeholders.
 */
class TemplateRegistry {
public:
    /**
     * @brief Load every template of a directory
     *
     * Never fails: unreadable manifests and bad entries are logged and the
     * built-in definitions fill in. Loading the same directory twice gives
     * equal registries.
     */
    static std::shared_ptr<const TemplateRegistry> loadAll(const std::string& directory);

    /**
     * @brief Build a registry from explicit entries (tests, embedding)
     */
    static std::shared_ptr<const TemplateRegistry> fromEntries(const std::vector<ManifestEntry>& entries,
                                                               const std::string& directory = "");

    /**
     * @brief Get a template by id
     * @throws core::TemplateNotFoundException for unknown ids
     */
    const Template& get(const std::string& template_id) const;

    bool contains(const std::string& template_id) const;

    /**
     * @brief Ordered template summaries with 150 px PNG thumbnails
     */
    std::vector<TemplateSummary> list() const;

    std::vector<std::string> ids() const;

    size_t size() const { return templates_.size(); }

    const std::string& getDirectory() const { return directory_; }

    /**
     * @brief Build one template from a manifest entry
     * @param directory Directory the entry's image path is relative to
     */
    static Template buildTemplate(const ManifestEntry& entry, const std::string& directory);

private:
    TemplateRegistry() = default;

    void add(Template tmpl);

    std::string directory_;
    std::vector<Template> templates_;
    std::map<std::string, size_t> index_;
};

} // namespace templates
} // namespace wojak
