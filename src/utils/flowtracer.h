#ifndef FLOWTRACER_H
#define FLOWTRACER_H

#include <QString>
#include <QtGlobal>

enum class FlowChannel
{
    Scan,
    Config,
    Reconcile,
    Import,
    Storage,
    Mutation
};

class FlowTracer
{
public:
    // Print a unified flow log line with channel and optional import ticket.
    static void log(FlowChannel channel, const QString &message, quint64 ticket = 0);
    static void warn(FlowChannel channel, const QString &message, quint64 ticket = 0);
};

#endif // FLOWTRACER_H
