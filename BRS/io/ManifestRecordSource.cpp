#include "ManifestRecordSource.h"
#include "../net/Encoding.h"

#include <cctype>
#include <fstream>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

ManifestRecordSource::ManifestRecordSource(const std::string& dir)
    : dataDir(dir) {}

bool ManifestRecordSource::validJobId(const std::string& jobId) {
    if (jobId.empty() || jobId.size() > 128 || jobId == "." || jobId == "..")
        return false;

    for (char ch : jobId) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && ch != '-' && ch != '_' && ch != '.')
            return false;
    }
    return jobId.find("..") == std::string::npos;
}

std::string ManifestRecordSource::manifestPath(const std::string& jobId) const {
    return (fs::path(dataDir) / (jobId + ".job")).string();
}

bool ManifestRecordSource::exists(const std::string& jobId) const {
    return validJobId(jobId) && fs::is_regular_file(manifestPath(jobId));
}

std::optional<Job> ManifestRecordSource::load(const std::string& jobId) {
    if (!exists(jobId))
        return std::nullopt;

    std::ifstream in(manifestPath(jobId));
    if (!in.is_open())
        return std::nullopt;

    Job job;
    job.id = jobId;

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        const std::string text = encoding::trim(line);
        if (text.empty() || text[0] == '#')
            continue;

        if (text[0] == '@') {
            const std::string rest = encoding::trim(text.substr(1));
            const auto space = rest.find_first_of(" \t");

            RecordRef record;
            record.id = rest.substr(0, space);
            record.displayName = space == std::string::npos ? std::string() : encoding::trim(rest.substr(space));
            if (record.id.empty())
                throw std::runtime_error(manifestPath(jobId) + ":" + std::to_string(lineNo) + ": record without id");

            job.items.push_back(std::move(record));
            continue;
        }

        const auto colon = text.find(':');
        if (colon == std::string::npos || colon == 0)
            throw std::runtime_error(manifestPath(jobId) + ":" + std::to_string(lineNo) + ": expected 'key: value'");

        std::string key = encoding::trim(text.substr(0, colon));
        std::string value = encoding::trim(text.substr(colon + 1));

        if (job.items.empty()) {
            if (key == "title")
                job.title = value;
            else
                throw std::runtime_error(manifestPath(jobId) + ":" + std::to_string(lineNo) + ": field before first record");
            continue;
        }

        job.items.back().renderInput.emplace_back(std::move(key), std::move(value));
    }

    if (job.title.empty())
        job.title = "Reports " + jobId;

    return job;
}
