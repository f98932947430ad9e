#pragma once
#include <optional>
#include <string>

#include "../core/RecordSource.h"

// Jobs stored as text manifests, one file per job: <dataDir>/<jobId>.job
//
//   # comment
//   title: Soil Reports
//   @ <record id> <display name>
//   <field>: <value>
//   ...
//
// Records keep file order.
class ManifestRecordSource : public RecordSource
{
public:
    explicit ManifestRecordSource(const std::string& dataDir);

    // Throws std::runtime_error on a malformed manifest.
    std::optional<Job> load(const std::string& jobId) override;

    bool exists(const std::string& jobId) const;
    std::string manifestPath(const std::string& jobId) const;

    static bool validJobId(const std::string& jobId);

private:
    std::string dataDir;
};
