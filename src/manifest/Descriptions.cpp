#include "manifest/Descriptions.hpp"

#include <unordered_map>

namespace fk::manifest {

std::string describe(const std::string_view suffix) {
    static const std::unordered_map<std::string_view, std::string_view> descriptions = {
        {"json", "Metadata regarding a specific run of pVAC-Seq"},
        {"chop.tsv", "Processed and filtered data, with peptide cleavage data added"},
        {"combined.parsed.tsv", "Processed data from IEDB, but with no filtering or extra data"},
        {"filtered.binding.tsv", "Processed data filtered by binding strength"},
        {"filtered.coverage.tsv", "Processed data filtered by binding strength and coverage"},
        {"stab.tsv", "Processed and filtered data, with peptide stability data added"},
        {"final.tsv", "Final output data"},
        {"tsv", "Raw input data parsed out of the input vcf"},
    };

    const auto it = descriptions.find(suffix);
    return it != descriptions.end() ? std::string(it->second) : "Unknown File";
}

std::string suffixOf(const std::filesystem::path& file) {
    const std::string name = file.filename().string();
    const auto dot = name.find('.');
    return dot == std::string::npos ? std::string{} : name.substr(dot + 1);
}

} // namespace fk::manifest
