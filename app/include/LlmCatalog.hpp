#ifndef LLMCATALOG_HPP
#define LLMCATALOG_HPP

#include "ProviderTypes.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Returns every known provider in declaration order. Built once, never mutated.
 * @return Provider descriptors.
 */
const std::vector<ProviderDescriptor>& provider_catalog();

/**
 * @brief Looks up a provider by id.
 * @param id Provider id such as "google" or "anthropic".
 * @return Provider descriptor, or nullptr when the id is unknown.
 */
const ProviderDescriptor* find_provider(std::string_view id);

/**
 * @brief Looks up a model by catalog key within a provider.
 * @param provider Provider to search.
 * @param model_id Catalog key of the model.
 * @return Model descriptor, or nullptr when the provider does not offer it.
 */
const ModelDescriptor* find_model(const ProviderDescriptor& provider, std::string_view model_id);

/**
 * @brief Returns the model flagged as default, or the first declared model when none is flagged.
 * @param provider Provider with at least one model.
 * @return Default model descriptor.
 */
const ModelDescriptor& default_model(const ProviderDescriptor& provider);

/**
 * @brief Like find_provider(), but throws ConfigurationError for unknown ids.
 */
const ProviderDescriptor& require_provider(std::string_view id);

/**
 * @brief Like find_model(), but throws ConfigurationError for unknown models.
 */
const ModelDescriptor& require_model(const ProviderDescriptor& provider, std::string_view model_id);

/**
 * @brief Matches a requested thinking level or reasoning effort against a model's declared values.
 * @return The declared spelling, or std::nullopt when the model does not offer the value.
 */
std::optional<std::string> declared_level(const std::vector<std::string>& levels, std::string_view requested);

/**
 * @brief Builds the secret-free listing used to populate provider/model pickers.
 * @return One entry per provider with its models in declaration order.
 */
std::vector<ProviderListing> list_providers();

#endif // LLMCATALOG_HPP
