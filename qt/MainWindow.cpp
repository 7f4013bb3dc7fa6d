#include "MainWindow.h"
#include "DisasmView.h"
#include "MemoryViewer.h"

#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QKeySequence>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLineEdit>
#include <QMessageBox>
#include <QStatusBar>
#include <QThread>

MainWindow::MainWindow(session::Session &session, cmd::Console &console,
                       QWidget *parent)
    : QMainWindow(parent)
    , m_session(session)
    , m_console(console)
    , m_lastLoad(console.defaults())
    , m_disasm(new DisasmView(session, this))
    , m_memViewer(nullptr)
    , m_cmdTimer(new QTimer(this))
{
    setWindowTitle("Dissect");
    setCentralWidget(m_disasm);
    resize(900, 640);

    buildMenus();

    connect(m_disasm, &DisasmView::statusMessage, this, [this](const QString &msg) {
        statusBar()->showMessage(msg, 4000);
    });
    connect(m_disasm, &DisasmView::addressSelected, this, [this](quint64 addr) {
        if (m_memViewer && m_memViewer->isVisible())
            m_memViewer->goTo(addr);
    });
    connect(m_cmdTimer, &QTimer::timeout, this, &MainWindow::pollCommands);

    statusBar()->showMessage("Open a binary with File > Open");
}

MainWindow::~MainWindow() {
    m_cmdTimer->stop();
    m_session.cancel();
    for (QThread *t : m_loaders)
        t->wait();
}

void MainWindow::serveCommands() {
    m_cmdTimer->start(50);
}

void MainWindow::pollCommands() {
    cmd::check_socket_commands(m_console, 0);
    refreshViews();
    if (!m_console.running())
        close();
}

void MainWindow::refreshViews() {
    m_disasm->refresh();
    if (m_memViewer)
        m_memViewer->refresh();
    auto st = m_session.current();
    m_reloadAction->setEnabled(st != nullptr);
    if (st)
        setWindowTitle(QString("Dissect - %1").arg(QString::fromStdString(st->name)));
}

/* ======================================================================== */
/* Loading                                                                   */
/* ======================================================================== */

void MainWindow::startLoad(const session::LoadOptions &opts) {
    m_lastLoad = opts;
    QString name = QFileInfo(QString::fromStdString(opts.path)).fileName();
    statusBar()->showMessage(QString("Analysing %1...").arg(name));

    QThread *thread = QThread::create([this, opts, name]() {
        session::LoadStatus st = m_session.load_file(opts);
        QString msg = QString::fromStdString(st.message);
        bool ok = st.ok();
        bool superseded = st.code == session::LoadError::CANCELLED;
        QMetaObject::invokeMethod(this, [this, name, ok, superseded, msg]() {
            loadFinished(name, ok, superseded, msg);
        }, Qt::QueuedConnection);
    });
    m_loaders.append(thread);
    connect(thread, &QThread::finished, this, [this, thread]() {
        m_loaders.removeOne(thread);
        thread->deleteLater();
    });
    thread->start();
}

void MainWindow::loadFinished(const QString &name, bool ok, bool superseded,
                              const QString &message) {
    if (!ok) {
        if (!superseded)
            QMessageBox::critical(this, "Load Failed",
                QString("Cannot load %1:\n%2").arg(name, message));
        statusBar()->clearMessage();
        return;
    }
    refreshViews();
    auto st = m_session.current();
    if (st)
        statusBar()->showMessage(QString("%1: %2 instructions, %3 undecodable")
            .arg(name)
            .arg(st->analysis.stats.instructions)
            .arg(st->analysis.stats.invalid), 8000);
}

void MainWindow::openFile() {
    QString path = QFileDialog::getOpenFileName(this, "Open Binary");
    if (path.isEmpty()) return;

    QStringList archs;
    int current = 0;
    for (const arch::Arch &a : arch::all_archs()) {
        if (a.machine == m_lastLoad.raw.machine)
            current = archs.size();
        archs << a.name;
    }
    bool ok;
    QString archName = QInputDialog::getItem(this, "Architecture",
        "Instruction set:", archs, current, false, &ok);
    if (!ok) return;

    QString base = QInputDialog::getText(this, "Load Address",
        "Base address (hex):", QLineEdit::Normal,
        QString::number(m_lastLoad.raw.base, 16), &ok);
    if (!ok) return;

    session::LoadOptions opts = m_lastLoad;
    opts.path = path.toStdString();
    opts.debug_path.clear();
    opts.raw.machine = arch::arch_by_name(archName.toUtf8().constData())->machine;
    opts.raw.base = base.toULongLong(&ok, 16);
    if (!ok) {
        QMessageBox::warning(this, "Load Address", "Invalid hex address");
        return;
    }
    opts.raw.entry.reset();
    startLoad(opts);
}

void MainWindow::reload() {
    if (!m_lastLoad.path.empty())
        startLoad(m_lastLoad);
}

/* ======================================================================== */
/* Navigation                                                                */
/* ======================================================================== */

void MainWindow::goTo() {
    auto st = m_session.current();
    if (!st) return;
    GoToDialog dlg(st, this);
    if (dlg.exec() != QDialog::Accepted) return;
    uint64_t addr;
    if (!dlg.address(addr)) {
        statusBar()->showMessage("Unknown address or symbol", 4000);
        return;
    }
    m_disasm->goToAddress(addr);
}

void MainWindow::openMemoryViewer() {
    if (!m_memViewer) {
        m_memViewer = new MemoryViewer(m_session, this);
        m_memViewer->setFloating(true);
        m_memViewer->resize(620, 400);
    }
    m_memViewer->refresh();
    m_memViewer->show();
    m_memViewer->raise();
}

void MainWindow::updateConfig() {
    proc::ProcessorConfig cfg = m_session.config();
    cfg.indirect = m_followAction->isChecked()
        ? proc::IndirectPolicy::FOLLOW_POINTERS : proc::IndirectPolicy::IGNORE;
    cfg.overlap = m_discardAction->isChecked()
        ? proc::OverlapPolicy::DISCARD_RUN : proc::OverlapPolicy::KEEP_CONFIRMED;
    m_session.set_config(cfg);
}

void MainWindow::buildMenus() {
    /* File menu */
    auto *fileMenu = menuBar()->addMenu("&File");
    fileMenu->addAction("Open...", this, &MainWindow::openFile, QKeySequence::Open);
    m_reloadAction = fileMenu->addAction("Reload", this, &MainWindow::reload,
                                         QKeySequence("Ctrl+Shift+R"));
    m_reloadAction->setEnabled(false);
    fileMenu->addSeparator();
    fileMenu->addAction("Quit", this, &QWidget::close, QKeySequence("Ctrl+Q"));

    /* Navigate menu */
    auto *navMenu = menuBar()->addMenu("&Navigate");
    navMenu->addAction("Go To...", this, &MainWindow::goTo, QKeySequence("Ctrl+G"));
    navMenu->addAction("Back", m_disasm, &DisasmView::goBack, QKeySequence::Back);

    /* Analysis menu */
    auto *anMenu = menuBar()->addMenu("&Analysis");
    const proc::ProcessorConfig &cfg = m_session.config();
    m_followAction = anMenu->addAction("Follow Code Pointers");
    m_followAction->setCheckable(true);
    m_followAction->setChecked(cfg.indirect == proc::IndirectPolicy::FOLLOW_POINTERS);
    connect(m_followAction, &QAction::toggled, this, &MainWindow::updateConfig);
    m_discardAction = anMenu->addAction("Discard Overlapping Runs");
    m_discardAction->setCheckable(true);
    m_discardAction->setChecked(cfg.overlap == proc::OverlapPolicy::DISCARD_RUN);
    connect(m_discardAction, &QAction::toggled, this, &MainWindow::updateConfig);
    anMenu->addSeparator();
    anMenu->addAction("Reanalyse", this, &MainWindow::reload);

    /* Tools menu */
    auto *toolsMenu = menuBar()->addMenu("&Tools");
    toolsMenu->addAction("Memory Viewer", this, &MainWindow::openMemoryViewer,
                         QKeySequence("Ctrl+M"));
}
