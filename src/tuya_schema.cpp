#include "tuya_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "tuya_config.h"

namespace phicore::tuya::ipc {

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

QJsonObject roomField(const QString &room, const QString &label)
{
    return field(room + QStringLiteral("DeviceId"),
                 QStringLiteral("String"),
                 label,
                 QStringLiteral("Tuya device id of the %1 light.").arg(label.toLower()));
}

QJsonArray schemaFields()
{
    QJsonArray fields;

    QJsonArray required{QStringLiteral("Required")};
    QJsonArray secret{QStringLiteral("Required"), QStringLiteral("Secret")};

    fields.append(field(QStringLiteral("baseUrl"),
                        QStringLiteral("String"),
                        QStringLiteral("API endpoint"),
                        QStringLiteral("Tuya OpenAPI data center, e.g. https://openapi.tuyaeu.com."),
                        QJsonValue(QString::fromLatin1(kDefaultBaseUrl)),
                        required));

    fields.append(field(QStringLiteral("accessKey"),
                        QStringLiteral("String"),
                        QStringLiteral("Access ID"),
                        QStringLiteral("Access ID (client id) of the Tuya cloud project."),
                        QJsonValue(),
                        required));

    fields.append(field(QStringLiteral("secretKey"),
                        QStringLiteral("Password"),
                        QStringLiteral("Access secret"),
                        QStringLiteral("Access secret of the Tuya cloud project."),
                        QJsonValue(),
                        secret));

    fields.append(roomField(QStringLiteral("bedroom"), QStringLiteral("Bedroom")));
    fields.append(roomField(QStringLiteral("livingroom"), QStringLiteral("Living room")));
    fields.append(roomField(QStringLiteral("diningroom"), QStringLiteral("Dining room")));
    fields.append(roomField(QStringLiteral("kitchen"), QStringLiteral("Kitchen")));

    fields.append(field(QStringLiteral("pollIntervalMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Poll interval"),
                        QStringLiteral("Status refresh interval while connected."),
                        QJsonValue(30000)));

    fields.append(field(QStringLiteral("retryIntervalMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Retry interval"),
                        QStringLiteral("Reconnect interval while the cloud is unavailable."),
                        QJsonValue(10000)));

    fields.append(field(QStringLiteral("requestTimeoutMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Request timeout"),
                        QStringLiteral("Upper bound for a single cloud request."),
                        QJsonValue(10000)));

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
    defaults.insert(QStringLiteral("actionPosition"), QStringLiteral("Inline"));
    defaults.insert(QStringLiteral("actionSpan"), 6);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

phicore::adapter::v1::AdapterActionDescriptor action(const char *id,
                                                     const char *label,
                                                     const char *description,
                                                     const char *metaJson)
{
    phicore::adapter::v1::AdapterActionDescriptor out;
    out.id = id;
    out.label = label;
    out.description = description;
    out.metaJson = metaJson;
    return out;
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "Tuya Cloud";
}

phicore::adapter::v1::Utf8String description()
{
    return "Provides Tuya smart lights through the Tuya cloud OpenAPI";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Tuya text logotype\">"
        "<rect x=\"1\" y=\"1\" width=\"22\" height=\"22\" rx=\"5\" fill=\"#FF4800\"/>"
        "<text x=\"12\" y=\"16\" text-anchor=\"middle\" font-family=\"'Geist','Inter','Arial',sans-serif\" font-weight=\"600\" font-size=\"9\" fill=\"#FFFFFF\">tuya</text>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    // Endpoint and keys come from the baseUrl/accessKey/secretKey fields of
    // the config schema, not from the host's generic connection fields.
    caps.required = v1::AdapterRequirement::UsesRetryInterval;
    caps.flags = v1::AdapterFlag::SupportsProbe
        | v1::AdapterFlag::RequiresPolling;

    caps.factoryActions.push_back(action("probe",
                                         "Test connection",
                                         "Request an access token with the configured credentials",
                                         R"({"placement":"card","kind":"command","requiresAck":true})"));

    caps.instanceActions.push_back(action("getDeviceId",
                                          "Get device id",
                                          "Resolve a room name (bedroom, living room, dining room, kitchen) to its device id",
                                          R"({"kind":"tool","params":{"roomName":"string"}})"));
    caps.instanceActions.push_back(action("getDeviceStatus",
                                          "Get device status",
                                          "Read power, brightness, temperature and color of a light",
                                          R"({"kind":"tool","params":{"deviceId":"string"}})"));
    caps.instanceActions.push_back(action("turnOnOff",
                                          "Turn on or off",
                                          "Turns the light on or off",
                                          R"({"kind":"tool","params":{"deviceId":"string","onOff":"boolean"}})"));
    caps.instanceActions.push_back(action("changeColor",
                                          "Change color",
                                          "Change the color of the light; 0<=h<=360, 0<=s<=1000, 0<=v<=1000",
                                          R"({"kind":"tool","params":{"deviceId":"string","h":"number","s":"number","v":"number"}})"));

    caps.defaultsJson = R"({"baseUrl":"https://openapi.tuyaeu.com","pollIntervalMs":30000,"retryIntervalMs":10000,"requestTimeoutMs":10000})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    const QJsonArray fields = schemaFields();

    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("Tuya Cloud Project"),
                          QStringLiteral("Configure access to a Tuya cloud development project."),
                          fields));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("Tuya Cloud Project"),
                          QStringLiteral("Configure access to a Tuya cloud development project."),
                          fields));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::tuya::ipc
