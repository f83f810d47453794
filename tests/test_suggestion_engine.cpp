#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "daemon/activity_store.hpp"
#include "daemon/rule_engine.hpp"
#include "daemon/suggestion_engine.hpp"

namespace {

hourglass::ActivityRecord terminal(const std::string &cwd, const std::string &title = "zsh")
{
    hourglass::ActivityRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.appName = "Terminal";
    record.bundleId = "com.apple.Terminal";
    record.windowTitle = title;
    record.extraInfo = cwd;
    record.durationSeconds = 60;
    return record;
}

hourglass::ActivityRecord browser(const std::string &url,
                                  const std::string &title,
                                  const std::string &app = "Firefox")
{
    hourglass::ActivityRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.appName = app;
    record.bundleId = "bundle." + app;
    record.windowTitle = title;
    record.url = url;
    record.durationSeconds = 30;
    return record;
}

hourglass::ActivityRecord figma(const std::string &file, const std::string &title)
{
    hourglass::ActivityRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.appName = "Figma";
    record.bundleId = "com.figma.Desktop";
    record.windowTitle = title;
    record.extraInfo = file;
    record.durationSeconds = 120;
    return record;
}

std::set<std::string> ignoredDomains()
{
    return {"google.com", "github.com", "localhost", "127.0.0.1"};
}

hourglass::SuggestionSettings defaultSettings()
{
    hourglass::SuggestionSettings settings;
    settings.minActivities = 2;
    settings.minApps = 1;
    settings.ignoredDomains = ignoredDomains();
    return settings;
}

} // namespace

class SuggestionEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testTerminalFolderProposal();
    void testDetectIsDeterministic();
    void testDomainAndFolderShareBrand();
    void testIgnoredDomainFallsBackToTitle();
    void testRulePerDistinguishingField();
    void testDesignFileProposal();
    void testThresholds();
    void testDismissAndRestore();
    void testExistingRuleSuppressesProposal();
    void testAcceptAssignsMatchingActivities();
    void testAcceptIntoExistingProject();
    void testAcceptValidation();
    void testTokenFor();
    void testSmartCapitalize();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_dbCounter = 0;
    std::unique_ptr<hourglass::ActivityStore> m_store;
    std::unique_ptr<hourglass::RuleEngine> m_rules;
};

void SuggestionEngineTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SuggestionEngineTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SuggestionEngineTests::init()
{
    const std::string path = m_tempDir.path().toStdString() + "/suggest-"
        + std::to_string(++m_dbCounter) + ".db";
    m_store = std::make_unique<hourglass::ActivityStore>(path);
    m_rules = std::make_unique<hourglass::RuleEngine>(*m_store);
}

void SuggestionEngineTests::cleanup()
{
    m_rules.reset();
    m_store.reset();
}

void SuggestionEngineTests::testTerminalFolderProposal()
{
    for (int i = 0; i < 5; ++i) {
        m_store->insertActivity(terminal("/Users/dev/code/saasbridge-web"));
    }
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    const auto brands = engine.detect();
    QCOMPARE(brands.size(), std::size_t(1));
    const auto &brand = brands.front();
    QCOMPARE(QString::fromStdString(brand.rootToken), QStringLiteral("root:saasbridge"));
    QCOMPARE(QString::fromStdString(brand.suggestedName), QStringLiteral("Saasbridge"));
    QCOMPARE(brand.totalActivities, 5);
    QCOMPARE(brand.totalSeconds, 300);

    QCOMPARE(brand.projects.size(), std::size_t(1));
    const auto &project = brand.projects.front();
    QCOMPARE(QString::fromStdString(project.token), QStringLiteral("folder:saasbridge-web"));
    QCOMPARE(QString::fromStdString(project.suggestedName), QStringLiteral("Web"));
    QCOMPARE(project.activityCount, 5);
    QCOMPARE(project.activityIds.size(), std::size_t(5));
    QCOMPARE(project.suggestedRules.size(), std::size_t(1));
    QCOMPARE(project.suggestedRules.front().ruleType, hourglass::RuleType::TerminalFolder);
    QCOMPARE(QString::fromStdString(project.suggestedRules.front().pattern),
             QStringLiteral("saasbridge-web"));
    QVERIFY(!project.suggestedRules.front().isRegex);

    // Detection never writes.
    QCOMPARE(m_store->queryUnassignedRaw().size(), std::size_t(5));
    QVERIFY(m_store->allBrands().empty());
}

void SuggestionEngineTests::testDetectIsDeterministic()
{
    m_store->insertActivity(browser("https://acme.com/", "Acme"));
    m_store->insertActivity(browser("https://globex.io/", "Globex"));
    m_store->insertActivity(terminal("/srv/initech/api"));
    m_store->insertActivity(browser("https://globex.io/pricing", "Globex"));
    m_store->insertActivity(browser("https://acme.com/about", "Acme"));
    m_store->insertActivity(terminal("/srv/initech/api"));
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    const auto first = nlohmann::json(engine.detect());
    const auto second = nlohmann::json(engine.detect());
    QCOMPARE(QString::fromStdString(first.dump()), QString::fromStdString(second.dump()));

    // Equal counts order by root token.
    QCOMPARE(first.size(), std::size_t(3));
    QCOMPARE(QString::fromStdString(first.at(0).value("rootToken", "")), QStringLiteral("root:acme"));
    QCOMPARE(QString::fromStdString(first.at(1).value("rootToken", "")), QStringLiteral("root:globex"));
    QCOMPARE(QString::fromStdString(first.at(2).value("rootToken", "")), QStringLiteral("root:initech"));
}

void SuggestionEngineTests::testDomainAndFolderShareBrand()
{
    for (int i = 0; i < 3; ++i) {
        m_store->insertActivity(browser("https://www.acme.com/page", "Acme"));
    }
    for (int i = 0; i < 2; ++i) {
        m_store->insertActivity(browser("https://app.acme.com/dash", "Dashboard"));
        m_store->insertActivity(terminal("/Users/dev/acme/api"));
    }
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    const auto brands = engine.detect();
    QCOMPARE(brands.size(), std::size_t(1));
    const auto &brand = brands.front();
    QCOMPARE(QString::fromStdString(brand.suggestedName), QStringLiteral("Acme"));
    QCOMPARE(brand.totalActivities, 7);
    QCOMPARE(brand.projects.size(), std::size_t(3));

    QCOMPARE(QString::fromStdString(brand.projects.at(0).token), QStringLiteral("domain:acme.com"));
    QCOMPARE(brand.projects.at(0).suggestedRules.front().ruleType, hourglass::RuleType::UrlDomain);
    QCOMPARE(QString::fromStdString(brand.projects.at(1).token), QStringLiteral("domain:app.acme.com"));
    QCOMPARE(QString::fromStdString(brand.projects.at(1).suggestedName), QStringLiteral("App"));
    QCOMPARE(QString::fromStdString(brand.projects.at(2).token), QStringLiteral("folder:acme/api"));
    QCOMPARE(QString::fromStdString(brand.projects.at(2).suggestedRules.front().pattern),
             QStringLiteral("acme/api"));
}

void SuggestionEngineTests::testIgnoredDomainFallsBackToTitle()
{
    m_store->insertActivity(browser("https://github.com/acme/roadmap", "Quarterly Plan - GitHub"));
    m_store->insertActivity(browser("https://github.com/acme/roadmap/issues",
                                    "Quarterly Plan - GitHub"));
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    const auto brands = engine.detect();
    QCOMPARE(brands.size(), std::size_t(1));
    const auto &project = brands.front().projects.front();
    QCOMPARE(QString::fromStdString(project.token), QStringLiteral("title:quarterly plan"));
    QCOMPARE(project.suggestedRules.front().ruleType, hourglass::RuleType::WindowTitle);
}

void SuggestionEngineTests::testThresholds()
{
    m_store->insertActivity(terminal("/srv/initech/api"));
    hourglass::SuggestionEngine lenient(*m_store, *m_rules, defaultSettings());
    QVERIFY(lenient.detect().empty());

    m_store->insertActivity(terminal("/srv/initech/api"));
    QCOMPARE(lenient.detect().size(), std::size_t(1));

    auto strictSettings = defaultSettings();
    strictSettings.minApps = 2;
    hourglass::SuggestionEngine strict(*m_store, *m_rules, strictSettings);
    QVERIFY(strict.detect().empty());

    auto editor = terminal("/srv/initech/api", "main.cpp");
    editor.appName = "Editor";
    m_store->insertActivity(editor);
    const auto brands = strict.detect();
    QCOMPARE(brands.size(), std::size_t(1));
    QCOMPARE(brands.front().projects.front().apps.size(), std::size_t(2));
}

void SuggestionEngineTests::testDismissAndRestore()
{
    for (int i = 0; i < 3; ++i) {
        m_store->insertActivity(terminal("/Users/dev/code/saasbridge-web"));
    }
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    engine.dismiss("folder:saasbridge-web");
    QVERIFY(engine.detect().empty());
    QCOMPARE(engine.dismissedTokens().size(), std::size_t(1));

    QVERIFY(engine.restore("folder:saasbridge-web"));
    QVERIFY(!engine.restore("folder:saasbridge-web"));
    QCOMPARE(engine.detect().size(), std::size_t(1));

    engine.dismiss("root:saasbridge");
    QVERIFY(engine.detect().empty());
    QVERIFY(engine.restore("root:saasbridge"));
    QCOMPARE(engine.detect().size(), std::size_t(1));

    QVERIFY_EXCEPTION_THROWN(engine.dismiss("  "), hourglass::ValidationError);
}

void SuggestionEngineTests::testExistingRuleSuppressesProposal()
{
    for (int i = 0; i < 3; ++i) {
        m_store->insertActivity(terminal("/Users/dev/code/saasbridge-web"));
    }
    const auto brand = m_store->insertBrand("Other");
    const auto project = m_store->insertProject(brand, "Elsewhere");
    m_store->insertRule(project, hourglass::RuleType::TerminalFolder, "SaaSBridge-Web", false);

    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());
    QVERIFY(engine.detect().empty());
}

void SuggestionEngineTests::testRulePerDistinguishingField()
{
    for (int i = 0; i < 3; ++i) {
        auto preview = browser("https://acme.com/preview", "Preview", "Code");
        preview.extraInfo = "/srv/acme/api";
        m_store->insertActivity(preview);
    }
    auto once = browser("https://acme.com/docs", "Docs", "Code");
    once.extraInfo = "/srv/acme/docs";
    m_store->insertActivity(once);

    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());
    const auto brands = engine.detect();
    QCOMPARE(brands.size(), std::size_t(1));
    QCOMPARE(brands.front().projects.size(), std::size_t(1));

    const auto &project = brands.front().projects.front();
    QCOMPARE(QString::fromStdString(project.token), QStringLiteral("domain:acme.com"));
    QCOMPARE(project.activityCount, 4);
    QCOMPARE(project.suggestedRules.size(), std::size_t(2));
    QCOMPARE(project.suggestedRules.at(0).ruleType, hourglass::RuleType::UrlDomain);
    QCOMPARE(QString::fromStdString(project.suggestedRules.at(0).pattern), QStringLiteral("acme.com"));
    QCOMPARE(project.suggestedRules.at(1).ruleType, hourglass::RuleType::TerminalFolder);
    QCOMPARE(QString::fromStdString(project.suggestedRules.at(1).pattern), QStringLiteral("acme/api"));

    // Only the rules that already exist are dropped.
    const auto brand = m_store->insertBrand("Acme");
    const auto existing = m_store->insertProject(brand, "Site");
    m_store->insertRule(existing, hourglass::RuleType::UrlDomain, "ACME.com", false);
    const auto again = engine.detect();
    QCOMPARE(again.size(), std::size_t(1));
    const auto &remaining = again.front().projects.front().suggestedRules;
    QCOMPARE(remaining.size(), std::size_t(1));
    QCOMPARE(remaining.front().ruleType, hourglass::RuleType::TerminalFolder);
}

void SuggestionEngineTests::testDesignFileProposal()
{
    for (int i = 0; i < 3; ++i) {
        m_store->insertActivity(figma("~/Design/Acme Landing.fig",
                                      "Acme Landing \xE2\x80\x93 Figma"));
    }
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    const auto brands = engine.detect();
    QCOMPARE(brands.size(), std::size_t(1));
    QCOMPARE(QString::fromStdString(brands.front().rootToken), QStringLiteral("root:acme"));
    const auto &project = brands.front().projects.front();
    QCOMPARE(QString::fromStdString(project.token), QStringLiteral("title:acme landing"));
    QCOMPARE(QString::fromStdString(project.suggestedName), QStringLiteral("Landing"));
    QCOMPARE(project.suggestedRules.size(), std::size_t(2));
    QCOMPARE(project.suggestedRules.at(0).ruleType, hourglass::RuleType::WindowTitle);
    QCOMPARE(project.suggestedRules.at(1).ruleType, hourglass::RuleType::DesignFile);
    QCOMPARE(QString::fromStdString(project.suggestedRules.at(1).pattern),
             QStringLiteral("Acme Landing.fig"));

    hourglass::AcceptRequest request;
    request.brandName = "Acme";
    request.projectName = "Landing";
    request.rules = {project.suggestedRules.at(1)};
    QCOMPARE(engine.accept(request), 3);
}

void SuggestionEngineTests::testAcceptAssignsMatchingActivities()
{
    for (int i = 0; i < 5; ++i) {
        m_store->insertActivity(terminal("/Users/dev/code/saasbridge-web"));
    }
    const auto other = m_store->insertActivity(terminal("/Users/dev/code/unrelated"));
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    hourglass::AcceptRequest request;
    request.brandName = "SaaSBridge";
    request.projectName = "Web";
    request.rules.push_back(hourglass::SuggestedRule{hourglass::RuleType::TerminalFolder,
                                                     "saasbridge-web", false});
    QCOMPARE(engine.accept(request), 5);

    const auto brand = m_store->findBrandByName("saasbridge");
    QVERIFY(brand.has_value());
    const auto project = m_store->findProjectByName(brand->id, "Web");
    QVERIFY(project.has_value());
    QCOMPARE(QString::fromStdString(project->color), QString::fromStdString(brand->color));
    QCOMPARE(m_store->rulesForProject(project->id).size(), std::size_t(1));

    const auto remaining = m_store->queryUnassignedRaw();
    QCOMPARE(remaining.size(), std::size_t(1));
    QCOMPARE(remaining.front().id, other);
    for (const auto &record : m_store->queryTimeline(remaining.front().date)) {
        if (record.id != other) {
            QCOMPARE(*record.projectId, project->id);
            QCOMPARE(*record.projectSource, hourglass::ProjectSource::Suggestion);
        }
    }

    // The new rule is live for the rule engine.
    QVERIFY(m_rules->match(terminal("/tmp/saasbridge-web")).has_value());
    QVERIFY(engine.detect().empty());

    // Same brand name again reuses the brand; the project name defaults to it.
    request.projectName.clear();
    request.rules.clear();
    QCOMPARE(engine.accept(request), 0);
    QCOMPARE(m_store->allBrands().size(), std::size_t(1));
    QVERIFY(m_store->findProjectByName(brand->id, "SaaSBridge").has_value());
}

void SuggestionEngineTests::testAcceptIntoExistingProject()
{
    const auto brand = m_store->insertBrand("Acme");
    const auto project = m_store->insertProject(brand, "Web");
    m_store->insertActivity(browser("https://acme.com/", "Acme"));
    m_store->insertActivity(browser("https://app.acme.com/", "Acme"));
    m_store->insertActivity(browser("https://example.org/", "Example"));
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    hourglass::AcceptRequest request;
    request.existingProjectId = project;
    request.rules.push_back(hourglass::SuggestedRule{hourglass::RuleType::UrlDomain,
                                                     "acme.com", false});
    QCOMPARE(engine.accept(request), 2);
    QCOMPARE(m_store->allProjects().size(), std::size_t(1));
}

void SuggestionEngineTests::testAcceptValidation()
{
    m_store->insertActivity(terminal("/Users/dev/code/saasbridge-web"));
    hourglass::SuggestionEngine engine(*m_store, *m_rules, defaultSettings());

    hourglass::AcceptRequest broken;
    broken.brandName = "SaaSBridge";
    broken.rules.push_back(hourglass::SuggestedRule{hourglass::RuleType::WindowTitle, "([", true});
    QVERIFY_EXCEPTION_THROWN(engine.accept(broken), hourglass::ValidationError);
    QVERIFY(m_store->allBrands().empty());

    hourglass::AcceptRequest nameless;
    QVERIFY_EXCEPTION_THROWN(engine.accept(nameless), hourglass::ValidationError);

    hourglass::AcceptRequest missingProject;
    missingProject.existingProjectId = 77;
    QVERIFY_EXCEPTION_THROWN(engine.accept(missingProject), hourglass::ValidationError);

    QCOMPARE(m_store->queryUnassignedRaw().size(), std::size_t(1));
}

void SuggestionEngineTests::testTokenFor()
{
    const auto ignored = ignoredDomains();

    const auto uk = hourglass::SuggestionEngine::tokenFor(
        browser("https://shop.acme.co.uk/basket", "Basket"), ignored);
    QVERIFY(uk.has_value());
    QCOMPARE(QString::fromStdString(uk->brandKey), QStringLiteral("root:acme"));
    QCOMPARE(QString::fromStdString(uk->token), QStringLiteral("domain:shop.acme.co.uk"));

    const auto local = hourglass::SuggestionEngine::tokenFor(
        browser("http://127.0.0.1:8080/", "Dev Server - Preview"), ignored);
    QVERIFY(local.has_value());
    QCOMPARE(QString::fromStdString(local->token), QStringLiteral("title:dev server"));

    const auto shortRoot = hourglass::SuggestionEngine::tokenFor(browser("https://ab.io/", "ab"),
                                                                 ignored);
    QVERIFY(!shortRoot.has_value());

    const auto home = hourglass::SuggestionEngine::tokenFor(terminal("/home/dev/acme"), ignored);
    QVERIFY(home.has_value());
    QCOMPARE(QString::fromStdString(home->token), QStringLiteral("folder:acme"));

    const auto generic = hourglass::SuggestionEngine::tokenFor(terminal("/Users/dev/code", ""),
                                                               ignored);
    QVERIFY(!generic.has_value());

    auto untitled = browser("", "Untitled");
    untitled.url.reset();
    QVERIFY(!hourglass::SuggestionEngine::tokenFor(untitled, ignored).has_value());

    auto appTitle = browser("", "Slack");
    appTitle.url.reset();
    appTitle.appName = "Slack";
    QVERIFY(!hourglass::SuggestionEngine::tokenFor(appTitle, ignored).has_value());
}

void SuggestionEngineTests::testSmartCapitalize()
{
    QCOMPARE(QString::fromStdString(hourglass::SuggestionEngine::smartCapitalize("saasbridge web")),
             QStringLiteral("Saasbridge Web"));
    QCOMPARE(QString::fromStdString(hourglass::SuggestionEngine::smartCapitalize("iOS app")),
             QStringLiteral("IOS App"));
    QCOMPARE(QString::fromStdString(hourglass::SuggestionEngine::smartCapitalize("")), QString());
}

QTEST_MAIN(SuggestionEngineTests)
#include "test_suggestion_engine.moc"
