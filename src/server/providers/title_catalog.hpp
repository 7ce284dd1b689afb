/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

title_catalog.hpp - In-memory title provider.*/

#pragma once

#include "providers.hpp"

#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace mmq {

// Titles served when no persisted store is configured.
std::vector<std::string> DefaultTitles();

class StaticTitleProvider : public TitleProvider {
public:
	explicit StaticTitleProvider(std::vector<std::string> titles);

	std::optional<std::string> RandomTitle() override;
	std::vector<std::string> Suggest(std::string_view query, size_t limit) override;

	size_t Size() const { return titles_.size(); }

private:
	std::vector<std::string> titles_;
	std::mutex randomMutex_;
	std::mt19937 random_;
};

} // namespace mmq
