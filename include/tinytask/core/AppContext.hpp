#pragma once

#include <QDateTime>
#include <QString>

#include <memory>
#include <optional>

#include "tinytask/core/AppSettings.hpp"

namespace tinytask {
namespace data {
class DataProvider;
class TaskStore;
}

namespace core {

struct DisabledState
{
    QDateTime disabledAt;
    QString reason;
};

class AppContext
{
public:
    explicit AppContext(AppSettings settings);
    ~AppContext();

    const AppSettings &settings() const;
    data::TaskStore &taskStore();

    std::optional<DisabledState> disabledState() const;
    bool isDisabled() const;
    void disable(const QString &reason, const QDateTime &now);
    void enable();

    void ensureEnabled() const;

private:
    QString markerPath() const;

    AppSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
};

} // namespace core
} // namespace tinytask
