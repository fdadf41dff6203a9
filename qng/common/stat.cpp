#include <qng/common/stat.hpp>

size_t constexpr qng::StatEntry::MAX_DETAILS;
qng::Stat<qng::ErrorCode> qng::Stats::error_;

qng::StatEntry::StatEntry() : count_(0), index_(0)
{
}

void qng::StatEntry::Add(uint64_t value, const std::string& detail)
{
    count_ += value;
    if (!detail.empty())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index_ < qng::StatEntry::MAX_DETAILS)
        {
            details_.push_back(detail);
        }
        else
        {
            details_[index_ % qng::StatEntry::MAX_DETAILS] = detail;
        }
        ++index_;
    }
}

uint64_t qng::StatEntry::Get() const
{
    return count_;
}

void qng::StatEntry::Get(uint64_t& value,
                         std::vector<std::string>& details) const
{
    value = count_;
    details.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_ <= qng::StatEntry::MAX_DETAILS)
    {
        details = details_;
    }
    else
    {
        uint64_t index = index_ % qng::StatEntry::MAX_DETAILS;
        details.insert(details.end(), details_.begin() + index, details_.end());
        details.insert(details.end(), details_.begin(),
                       details_.begin() + index);
    }
}

void qng::StatEntry::Reset()
{
    count_ = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    index_ = 0;
    details_.clear();
}

void qng::Stats::Add(qng::ErrorCode error_code)
{
    error_.Add(error_code, 1, std::string());
}

void qng::Stats::Add(const qng::Error& error)
{
    if (!error)
    {
        return;
    }
    error_.Add(error.code_, 1, error.message_);
}

uint64_t qng::Stats::Get(qng::ErrorCode error_code)
{
    return error_.Get(error_code);
}

std::vector<qng::StatResult<qng::ErrorCode>> qng::Stats::GetAll()
{
    return error_.GetAll();
}

void qng::Stats::Reset(qng::ErrorCode error_code)
{
    error_.Reset(error_code);
}

void qng::Stats::SerializeJson(qng::Json& json)
{
    qng::Json errors = qng::Json::array();
    for (const auto& i : GetAll())
    {
        qng::Json entry;
        entry["code"] = static_cast<int>(i.index_);
        entry["kind"] = qng::ErrorKindString(qng::ErrorCodeKind(i.index_));
        entry["description"] = qng::ErrorString(i.index_);
        entry["count"] = i.count_;
        entry["details"] = i.details_;
        errors.push_back(entry);
    }
    json["errors"] = errors;
}
