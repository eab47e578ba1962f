/**
 * @file main.cpp
 * @brief themisd 메인 진입점
 *
 * QCoreApplication 초기화, CLI 인수 파싱, 설정 편집 명령 처리,
 * 테마 결정 엔진 실행, 시그널 핸들링을 수행합니다.
 *
 * CLI 옵션:
 *   --themes-dir <경로>    테마 디렉토리 (기본: AppData/themes)
 *   --config <파일>        INI 설정 파일 (기본: 플랫폼 QSettings)
 *   --hook <명령>          테마 적용 후 실행할 프로그램
 *   --list-themes          카탈로그 출력 후 종료
 *   --list-rules           스케줄 규칙 출력 후 종료
 *   --set-manual <ID>      수동 테마 지정 후 종료
 *   --pool-toggle <ID>     랜덤 풀 포함 여부 토글 후 종료
 *   --add-rule <규칙>      "이름|테마|요일|시작|종료" 규칙 추가 후 종료
 *   --remove-rule <ID>     규칙 삭제 후 종료
 *   --randomize-now        랜덤 테마 즉시 선택 후 종료
 *   --once                 한 번 평가하고 종료
 */

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QStandardPaths>

#include <csignal>
#include <iostream>
#include <memory>

#include "catalog/directory_catalog.h"
#include "config/config_codec.h"
#include "config/settings_config_store.h"
#include "core/schedule_resolver.h"
#include "engine/theme_controller.h"

using namespace Themis;

namespace {

// ============================================================
// 전역 상태 (시그널 핸들러에서 접근)
// ============================================================

QCoreApplication* g_app = nullptr;

/**
 * @brief SIGINT/SIGTERM 수신 시 이벤트 루프 종료
 */
void signalHandler(int signum) {
    std::cerr << "\n[Themis] 시그널 " << signum << " 수신 — 종료 중..." << std::endl;
    if (g_app) {
        g_app->quit();
    }
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

// ============================================================
// 테마 디렉토리
// ============================================================

/**
 * @brief 테마 디렉토리 경로 결정
 * @param requested CLI 지정 경로 (빈 문자열이면 기본 경로)
 */
QString resolveThemesDir(const QString& requested) {
    if (!requested.isEmpty()) return QDir(requested).absolutePath();

    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir::homePath() + "/.themis";
    }
    return QDir(base).filePath("themes");
}

// ============================================================
// 출력 / 편집 명령
// ============================================================

void printThemes(const QList<ThemeDescriptor>& themes, const QString& manual,
                 const std::optional<QString>& active) {
    if (themes.isEmpty()) {
        std::cout << "사용 가능한 테마가 없습니다. 테마 디렉토리에 테마를 추가하세요." << std::endl;
        return;
    }
    for (const auto& theme : themes) {
        std::cout << (active && *active == theme.id ? "* " : "  ")
                  << theme.id.toStdString() << "  " << theme.displayName.toStdString();
        if (theme.note) std::cout << " — " << theme.note->toStdString();
        if (theme.id == manual) std::cout << "  [manual]";
        std::cout << std::endl;
    }
}

void printRules(const QList<ScheduleRule>& rules) {
    if (rules.isEmpty()) {
        std::cout << "스케줄 규칙이 없습니다." << std::endl;
        return;
    }
    for (const auto& rule : rules) {
        QStringList days;
        for (int d : rule.days) days << dayName(d).left(3);
        std::cout << rule.id.toStdString() << "  " << rule.name.toStdString()
                  << "  " << rule.themeId.toStdString()
                  << "  " << days.join(",").toStdString()
                  << "  " << rule.start.toStdString() << "-" << rule.end.toStdString()
                  << std::endl;
    }
}

/**
 * @brief "이름|테마|요일|시작|종료" 문자열로 규칙 생성
 *
 * 빠진 항목은 편집기 기본값(오늘, 08:00~17:00, 첫 번째 테마)을 따름.
 * 요일은 0(일)~6(토) 쉼표 목록.
 */
ScheduleRule parseRuleText(const QString& text, const QList<ThemeDescriptor>& catalog,
                           int existingCount) {
    ScheduleRule rule = Core::ScheduleResolver::makeDefaultRule(
        catalog, existingCount, QDateTime::currentDateTime());

    const QStringList parts = text.split('|');
    if (parts.size() > 0 && !parts[0].trimmed().isEmpty()) rule.name = parts[0].trimmed();
    if (parts.size() > 1 && !parts[1].trimmed().isEmpty()) rule.themeId = parts[1].trimmed();
    if (parts.size() > 2 && !parts[2].trimmed().isEmpty()) {
        QList<int> days;
        for (const QString& d : parts[2].split(',', Qt::SkipEmptyParts)) {
            bool ok = false;
            const int day = d.trimmed().toInt(&ok);
            if (ok) days << day;
        }
        rule.days = Config::ConfigCodec::normalizeDays(days);
    }
    if (parts.size() > 3 && !parts[3].trimmed().isEmpty()) rule.start = parts[3].trimmed();
    if (parts.size() > 4 && !parts[4].trimmed().isEmpty()) rule.end = parts[4].trimmed();
    return rule;
}

} // anonymous namespace


// ============================================================
// 메인 함수
// ============================================================

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("themisd");
    QCoreApplication::setApplicationVersion("1.0.0");
    QCoreApplication::setOrganizationName("Themis");

    g_app = &app;

    // ---- CLI 인수 파싱 ----
    QCommandLineParser parser;
    parser.setApplicationDescription("Themis — 우선순위 기반 테마 선택 데몬");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption themesDirOption("themes-dir", "테마 디렉토리 경로", "path");
    QCommandLineOption configOption("config", "INI 설정 파일 경로", "file");
    QCommandLineOption hookOption("hook", "테마 적용 후 실행할 프로그램 (테마 ID가 인자로 전달됨)", "command");
    QCommandLineOption listThemesOption("list-themes", "테마 목록 출력");
    QCommandLineOption listRulesOption("list-rules", "스케줄 규칙 출력");
    QCommandLineOption setManualOption("set-manual", "수동 테마 지정", "id");
    QCommandLineOption poolToggleOption("pool-toggle", "랜덤 풀에 테마 추가/제거", "id");
    QCommandLineOption addRuleOption("add-rule", "스케줄 규칙 추가 (이름|테마|요일|시작|종료)", "rule");
    QCommandLineOption removeRuleOption("remove-rule", "스케줄 규칙 삭제", "id");
    QCommandLineOption randomizeOption("randomize-now", "랜덤 테마 즉시 선택");
    QCommandLineOption onceOption("once", "한 번 평가하고 종료");

    parser.addOptions({themesDirOption, configOption, hookOption, listThemesOption,
                       listRulesOption, setManualOption, poolToggleOption, addRuleOption,
                       removeRuleOption, randomizeOption, onceOption});
    parser.process(app);

    // ---- 협력 객체 구성 ----
    const QString themesDir = resolveThemesDir(parser.value(themesDirOption));
    Catalog::DirectoryCatalog catalog(themesDir, parser.value(hookOption));
    if (!catalog.ensureDirectory()) {
        std::cerr << "[Themis] 테마 디렉토리를 사용할 수 없음: " << themesDir.toStdString() << std::endl;
        return 1;
    }

    std::unique_ptr<Config::SettingsConfigStore> config;
    if (parser.isSet(configOption)) {
        config = std::make_unique<Config::SettingsConfigStore>(parser.value(configOption));
    } else {
        config = std::make_unique<Config::SettingsConfigStore>();
    }

    // ---- 일회성 명령 ----
    if (parser.isSet(listThemesOption)) {
        printThemes(catalog.listThemes(), config->manualThemeId(), catalog.activeThemeId());
        return 0;
    }
    if (parser.isSet(listRulesOption)) {
        printRules(config->scheduleRules());
        return 0;
    }

    bool edited = false;
    if (parser.isSet(setManualOption)) {
        config->setManualThemeId(parser.value(setManualOption));
        edited = true;
    }
    if (parser.isSet(poolToggleOption)) {
        const QString id = parser.value(poolToggleOption);
        const bool added = config->togglePoolMember(id);
        std::cout << "[Themis] 랜덤 풀 " << (added ? "추가: " : "제거: ") << id.toStdString() << std::endl;
        edited = true;
    }
    if (parser.isSet(addRuleOption)) {
        const ScheduleRule rule = parseRuleText(parser.value(addRuleOption), catalog.listThemes(),
                                                config->scheduleRules().size());
        if (!config->addScheduleRule(rule)) return 1;
        std::cout << "[Themis] 규칙 추가: " << rule.id.toStdString() << std::endl;
        edited = true;
    }
    if (parser.isSet(removeRuleOption)) {
        if (!config->removeScheduleRule(parser.value(removeRuleOption))) {
            std::cerr << "[Themis] 규칙을 찾을 수 없음: "
                      << parser.value(removeRuleOption).toStdString() << std::endl;
            return 1;
        }
        edited = true;
    }

    // ---- 엔진 ----
    Engine::ThemeController controller(config.get(), &catalog, &catalog);

    if (edited || parser.isSet(onceOption) || parser.isSet(randomizeOption)) {
        controller.runOnce(parser.isSet(randomizeOption));
        config->sync();
        return 0;
    }

    installSignalHandlers();
    std::cout << "[Themis] 테마 디렉토리: " << themesDir.toStdString() << std::endl;
    std::cout << "[Themis] 설정 파일: " << config->fileName().toStdString() << std::endl;

    controller.start();
    const int rc = app.exec();
    controller.stop();

    std::cout << "[Themis] 종료 완료" << std::endl;
    return rc;
}
