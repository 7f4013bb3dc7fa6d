#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QList>
#include <QTimer>

#include "cmd.hpp"
#include "session.hpp"

QT_BEGIN_NAMESPACE
class QThread;
class QAction;
QT_END_NAMESPACE

class DisasmView;
class MemoryViewer;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(session::Session &session, cmd::Console &console,
               QWidget *parent = nullptr);
    ~MainWindow();

    /* Load in the background; the views switch over when it succeeds. */
    void startLoad(const session::LoadOptions &opts);

    /* Poll the TCP command socket from the UI thread. */
    void serveCommands();

private slots:
    void openFile();
    void reload();
    void goTo();
    void openMemoryViewer();
    void updateConfig();
    void pollCommands();
    void loadFinished(const QString &name, bool ok, bool superseded,
                      const QString &message);

private:
    void buildMenus();
    void refreshViews();

    session::Session    &m_session;
    cmd::Console        &m_console;
    session::LoadOptions m_lastLoad;
    DisasmView          *m_disasm;
    MemoryViewer        *m_memViewer;
    QTimer              *m_cmdTimer;
    QList<QThread *>     m_loaders;
    QAction             *m_reloadAction;
    QAction             *m_followAction;
    QAction             *m_discardAction;
};

#endif // MAINWINDOW_H
