#pragma once
#include <optional>
#include <string>

#include "utils.h"

class RecordSource {
public:
    virtual ~RecordSource() = default;

    // nullopt when the job id is unknown. A known job may have zero items.
    virtual std::optional<Job> load(const std::string& jobId) = 0;
};
