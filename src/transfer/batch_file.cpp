#include "batch_file.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

static Result<FileSpec> parse_file_entry(const YAML::Node& n, size_t index) {
    if (!n.IsMap()) {
        return Result<FileSpec>::Err(fmt::format("batch entry {} is not a mapping", index));
    }

    FileSpec f;
    f.lfn = n["lfn"].as<std::string>("");
    if (f.lfn.empty()) {
        return Result<FileSpec>::Err(fmt::format("batch entry {} has no lfn", index));
    }
    f.scope = n["scope"].as<std::string>("");
    f.dataset = n["dataset"].as<std::string>("");
    f.guid = n["guid"].as<std::string>("");
    f.ddmendpoint = n["ddmendpoint"].as<std::string>("");
    f.turl = n["turl"].as<std::string>("");
    f.surl = n["surl"].as<std::string>("");
    f.filesize = n["filesize"].as<int64_t>(0);
    f.accessmode = n["accessmode"].as<std::string>("");
    f.workdir = n["workdir"].as<std::string>("");

    if (n["checksum"] && n["checksum"].IsMap()) {
        for (const auto& kv : n["checksum"]) {
            f.checksum[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }
    return Result<FileSpec>::Ok(f);
}

static Result<std::vector<FileSpec>> build_batch(const YAML::Node& root) {
    const YAML::Node list = root.IsMap() ? root["files"] : root;
    if (!list || !list.IsSequence()) {
        return Result<std::vector<FileSpec>>::Err("batch must be a list of files or have a 'files' list");
    }

    std::vector<FileSpec> files;
    for (size_t i = 0; i < list.size(); i++) {
        auto f = parse_file_entry(list[i], i);
        if (f.is_err()) return Result<std::vector<FileSpec>>::Err(f.error);
        files.push_back(std::move(f.value));
    }
    return Result<std::vector<FileSpec>>::Ok(std::move(files));
}

Result<std::vector<FileSpec>> parse_batch(const std::string& yaml_text) {
    try {
        return build_batch(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<std::vector<FileSpec>>::Err(fmt::format("invalid batch: {}", e.what()));
    }
}

Result<std::vector<FileSpec>> load_batch_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<std::vector<FileSpec>>::Err("batch file not found: " + path.string());
    }
    try {
        return build_batch(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        return Result<std::vector<FileSpec>>::Err(
            fmt::format("invalid batch file {}: {}", path.string(), e.what()));
    }
}

Result<std::vector<FileSpec>> files_from_lists(const std::string& lfns,
                                               const std::string& scopes,
                                               const std::string& turls) {
    auto lfn_list = split(lfns, ',');
    auto scope_list = split(scopes, ',');
    auto turl_list = split(turls, ',');

    if (lfn_list.empty()) {
        return Result<std::vector<FileSpec>>::Err("no LFNs given");
    }
    if (lfn_list.size() != scope_list.size()) {
        xstage_warn(fmt::format("file lists not same length: len(lfns)={}, len(scopes)={}",
                                lfn_list.size(), scope_list.size()));
    }
    if (!turl_list.empty() && turl_list.size() != lfn_list.size()) {
        return Result<std::vector<FileSpec>>::Err(fmt::format(
            "got {} turls for {} lfns", turl_list.size(), lfn_list.size()));
    }

    std::vector<FileSpec> files;
    for (size_t i = 0; i < lfn_list.size(); i++) {
        FileSpec f;
        f.lfn = lfn_list[i];
        if (i < scope_list.size()) f.scope = scope_list[i];
        if (i < turl_list.size()) f.turl = turl_list[i];
        files.push_back(std::move(f));
    }
    return Result<std::vector<FileSpec>>::Ok(std::move(files));
}

std::string format_summary(const std::vector<FileSpec>& files,
                           const std::optional<TypedError>& error) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& f : files) {
        out << YAML::Key << f.lfn << YAML::Value
            << YAML::Flow << YAML::BeginSeq << file_status_name(f.status) << f.status_code << YAML::EndSeq;
    }
    out << YAML::Key << "error" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    if (error) {
        out << error->message() << error->numeric_code();
    } else {
        out << "" << 0;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

Result<void> write_summary(const fs::path& path, const std::vector<FileSpec>& files,
                           const std::optional<TypedError>& error) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("cannot write summary to " + path.string());
    }
    out << format_summary(files, error) << "\n";
    return Result<void>::Ok();
}
