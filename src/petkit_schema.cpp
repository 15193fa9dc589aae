#include "petkit_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "petkit_config.h"

namespace phicore::petkit::ipc {

namespace {

QJsonObject responsive(int xs, int sm, int md, int lg, int xl, int xxl)
{
    QJsonObject out;
    out.insert(QStringLiteral("xs"), xs);
    out.insert(QStringLiteral("sm"), sm);
    out.insert(QStringLiteral("md"), md);
    out.insert(QStringLiteral("lg"), lg);
    out.insert(QStringLiteral("xl"), xl);
    out.insert(QStringLiteral("xxl"), xxl);
    return out;
}

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray schemaFields()
{
    QJsonArray fields;

    QJsonArray requiredFlags;
    requiredFlags.append(QStringLiteral("Required"));
    fields.append(field(QStringLiteral("username"),
                        QStringLiteral("String"),
                        QStringLiteral("Username"),
                        QStringLiteral("Petkit account user name or phone number."),
                        QJsonValue(),
                        requiredFlags));

    QJsonArray passwordFlags;
    passwordFlags.append(QStringLiteral("Secret"));
    fields.append(field(QStringLiteral("password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Petkit account password. An MD5 digest is accepted as well."),
                        QJsonValue(),
                        passwordFlags));

    fields.append(field(QStringLiteral("apiBase"),
                        QStringLiteral("String"),
                        QStringLiteral("API base URL"),
                        QStringLiteral("Petkit cloud endpoint for the account region."),
                        QJsonValue(QString::fromLatin1(kDefaultApiBase))));

    fields.append(field(QStringLiteral("pollIntervalMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Poll interval"),
                        QStringLiteral("Delay between two device roster refreshes."),
                        QJsonValue(kDefaultPollIntervalMs)));

    fields.append(field(QStringLiteral("timeoutMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Request timeout"),
                        QStringLiteral("Timeout of a single Petkit API call."),
                        QJsonValue(kDefaultTimeoutMs)));

    return fields;
}

QJsonObject section(const QString &title, const QString &description, const QJsonArray &fields)
{
    QJsonObject layout;
    layout.insert(QStringLiteral("gridUnits"), 24);
    QJsonArray gutter;
    gutter.append(12);
    gutter.append(8);
    layout.insert(QStringLiteral("gutter"), gutter);

    QJsonObject defaults;
    defaults.insert(QStringLiteral("span"), responsive(24, 24, 12, 12, 12, 12));
    defaults.insert(QStringLiteral("labelPosition"), QStringLiteral("Left"));
    defaults.insert(QStringLiteral("labelSpan"), 8);
    defaults.insert(QStringLiteral("controlSpan"), 16);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "Petkit";
}

phicore::adapter::v1::Utf8String description()
{
    return "Provides Petkit feeders from the Petkit cloud";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Petkit feeder\">"
        "<rect x=\"5\" y=\"3\" width=\"14\" height=\"12\" rx=\"3\" fill=\"none\" stroke=\"#F29A2E\" stroke-width=\"2\"/>"
        "<path d=\"M4 17h16l-2 4H6z\" fill=\"#F29A2E\"/>"
        "<circle cx=\"12\" cy=\"9\" r=\"2\" fill=\"#F29A2E\"/>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    caps.flags = v1::AdapterFlag::SupportsProbe
        | v1::AdapterFlag::RequiresPolling;

    v1::AdapterActionDescriptor probe;
    probe.id = kActionProbe;
    probe.label = "Test login";
    probe.description = "Log in to the Petkit cloud with the entered credentials";
    probe.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.factoryActions.push_back(probe);

    v1::AdapterActionDescriptor refresh;
    refresh.id = kActionRefresh;
    refresh.label = "Refresh devices";
    refresh.description = "Fetch the device roster of every account now.";
    refresh.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.instanceActions.push_back(refresh);

    caps.defaultsJson = R"({"apiBase":"http://api.petkit.cn/6/","pollIntervalMs":120000,"timeoutMs":20000})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    const QJsonArray fields = schemaFields();

    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("Petkit Account"),
                          QStringLiteral("Configure the Petkit cloud account."),
                          fields));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("Petkit Account"),
                          QStringLiteral("Configure the Petkit cloud account."),
                          fields));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::petkit::ipc
