#pragma once

#include "core/theme_types.h"

#include <QList>
#include <QString>

#include <optional>

namespace Themis {
namespace Catalog {

// ============================================================
// CatalogProvider — 사용 가능한 테마 목록 / 현재 적용 테마 조회
// ============================================================
class CatalogProvider {
public:
    virtual ~CatalogProvider() = default;

    // 비어 있을 수 있음. 예외를 던지지 않아야 함
    virtual QList<ThemeDescriptor> listThemes() const = 0;
    virtual std::optional<QString> activeThemeId() const = 0;
};

// ============================================================
// ThemeApplier — ID로 테마 적용 (결과는 확인하지 않음)
// ============================================================
class ThemeApplier {
public:
    virtual ~ThemeApplier() = default;

    virtual void apply(const QString& themeId) = 0;
};

} // namespace Catalog
} // namespace Themis
