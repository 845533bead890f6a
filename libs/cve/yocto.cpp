/**
 * @file yocto.cpp
 * @brief Yocto cve-check summary reader
 */

#include "kcfgvex/cve.hpp"

#include "kcfgvex/canonical_json.hpp"

#include <algorithm>
#include <set>

namespace kcfgvex::cve {

namespace {

constexpr std::string_view kKernelProduct = "linux_kernel";
constexpr std::string_view kPatchedStatus = "Patched";

[[nodiscard]] bool is_kernel_package(const nlohmann::json& package)
{
    auto products = package.find("products");
    if (products == package.end() || !products->is_array()) {
        return false;
    }
    return std::ranges::any_of(*products, [](const nlohmann::json& product) {
        if (!product.is_object()) {
            return false;
        }
        auto name = product.find("product");
        return name != product.end() && name->is_string()
               && name->get_ref<const std::string&>() == kKernelProduct;
    });
}

}  // namespace

YoctoCves extract_yocto_cves(const nlohmann::json& summary)
{
    std::set<std::string> unpatched;
    std::set<std::string> patched;
    auto packages = summary.find("package");
    if (!summary.is_object() || packages == summary.end() || !packages->is_array()) {
        return {};
    }
    for (const auto& package : *packages) {
        if (!package.is_object() || !is_kernel_package(package)) {
            continue;
        }
        auto issues = package.find("issue");
        if (issues == package.end() || !issues->is_array()) {
            continue;
        }
        for (const auto& issue : *issues) {
            if (!issue.is_object()) {
                continue;
            }
            auto id = issue.find("id");
            if (id == issue.end() || !id->is_string()) {
                continue;
            }
            const std::string& cve_id = id->get_ref<const std::string&>();
            if (!cve_id.starts_with("CVE-")) {
                continue;
            }
            auto status = issue.find("status");
            if (status != issue.end() && status->is_string()
                && status->get_ref<const std::string&>() == kPatchedStatus) {
                patched.insert(cve_id);
            } else {
                unpatched.insert(cve_id);
            }
        }
    }
    return YoctoCves{.unpatched = {unpatched.begin(), unpatched.end()},
                     .patched = {patched.begin(), patched.end()}};
}

kcfgvex::Result<YoctoCves> load_yocto_summary(const std::filesystem::path& path)
{
    auto json = canonical::read_json_file(path);
    if (!json) {
        return std::unexpected(json.error());
    }
    return extract_yocto_cves(*json);
}

}  // namespace kcfgvex::cve
