#include "flowtracer.h"

#include <QDebug>

namespace
{
QString channelLabel(FlowChannel channel)
{
    switch (channel)
    {
    case FlowChannel::Scan: return QStringLiteral("scan");
    case FlowChannel::Config: return QStringLiteral("config");
    case FlowChannel::Reconcile: return QStringLiteral("reconcile");
    case FlowChannel::Import: return QStringLiteral("import");
    case FlowChannel::Storage: return QStringLiteral("storage");
    case FlowChannel::Mutation: return QStringLiteral("mutation");
    }
    return QStringLiteral("unknown");
}

QString composeLine(FlowChannel channel, const QString &message, quint64 ticket)
{
    const QString channelPart = QStringLiteral("[flow][%1]").arg(channelLabel(channel));
    if (ticket == 0) return QStringLiteral("%1 %2").arg(channelPart, message);
    return QStringLiteral("%1[ticket%2] %3").arg(channelPart, QString::number(ticket), message);
}
} // namespace

void FlowTracer::log(FlowChannel channel, const QString &message, quint64 ticket)
{
    qInfo().noquote() << composeLine(channel, message, ticket);
}

void FlowTracer::warn(FlowChannel channel, const QString &message, quint64 ticket)
{
    qWarning().noquote() << composeLine(channel, message, ticket);
}
