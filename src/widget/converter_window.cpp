#include "converter_window.h"

#include <QButtonGroup>
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFont>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QRadioButton>
#include <QVBoxLayout>
#include <QtConcurrent/QtConcurrentRun>

ConverterWindow::ConverterWindow(const AppContext &ctx, QWidget *parent)
    : QWidget(parent), ctx_(ctx)
{
    setWindowTitle(QStringLiteral("文件转换工具"));
    resize(600, 450);
    buildUi();
    settings_ = AppSettings::loadFile(ctx_.configPath);
    applySettings();
    connect(&convertWatcher_, &QFutureWatcher<ConversionResult>::finished, this,
            &ConverterWindow::handleConversionFinished);
}

ConverterWindow::~ConverterWindow()
{
    // 不能在工作线程仍持有参数时析构
    if (convertWatcher_.isRunning()) convertWatcher_.waitForFinished();
}

void ConverterWindow::buildUi()
{
    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->setContentsMargins(10, 10, 10, 10);

    QLabel *title = new QLabel(QStringLiteral("文件转换工具"), this);
    QFont titleFont = title->font();
    titleFont.setPointSize(16);
    titleFont.setBold(true);
    title->setFont(titleFont);
    title->setAlignment(Qt::AlignCenter);
    layout->addWidget(title);
    layout->addSpacing(10);

    // 转换类型：两列三行
    typeBox_ = new QGroupBox(QStringLiteral("选择转换类型"), this);
    QGridLayout *typeLayout = new QGridLayout(typeBox_);
    kindGroup_ = new QButtonGroup(this);
    const QList<ConversionKind> kinds = ConverterRegistry::allKinds();
    for (int i = 0; i < kinds.size(); ++i)
    {
        QRadioButton *radio = new QRadioButton(ConverterRegistry::kindLabel(kinds.at(i)), typeBox_);
        radio->setObjectName(ConverterRegistry::kindId(kinds.at(i)));
        kindGroup_->addButton(radio, static_cast<int>(kinds.at(i)));
        typeLayout->addWidget(radio, i / 2, i % 2);
    }
    layout->addWidget(typeBox_);

    QGroupBox *fileBox = new QGroupBox(QStringLiteral("选择文件"), this);
    QHBoxLayout *fileLayout = new QHBoxLayout(fileBox);
    inputEdit_ = new QLineEdit(fileBox);
    browseInputButton_ = new QPushButton(QStringLiteral("浏览"), fileBox);
    fileLayout->addWidget(inputEdit_, 1);
    fileLayout->addWidget(browseInputButton_);
    layout->addWidget(fileBox);

    QGroupBox *outputBox = new QGroupBox(QStringLiteral("输出目录"), this);
    QHBoxLayout *outputLayout = new QHBoxLayout(outputBox);
    outputEdit_ = new QLineEdit(outputBox);
    browseOutputButton_ = new QPushButton(QStringLiteral("浏览"), outputBox);
    outputLayout->addWidget(outputEdit_, 1);
    outputLayout->addWidget(browseOutputButton_);
    layout->addWidget(outputBox);

    startButton_ = new QPushButton(QStringLiteral("开始转换"), this);
    QHBoxLayout *startLayout = new QHBoxLayout;
    startLayout->addStretch();
    startLayout->addWidget(startButton_);
    startLayout->addStretch();
    layout->addSpacing(10);
    layout->addLayout(startLayout);
    layout->addSpacing(10);

    progress_ = new QProgressBar(this);
    progress_->setRange(0, 1);
    progress_->setValue(0);
    progress_->setTextVisible(false);
    layout->addWidget(progress_);

    statusLabel_ = new QLabel(QStringLiteral("准备就绪"), this);
    statusLabel_->setAlignment(Qt::AlignCenter);
    layout->addWidget(statusLabel_);
    layout->addStretch();

    connect(browseInputButton_, &QPushButton::clicked, this, &ConverterWindow::handleBrowseInput);
    connect(browseOutputButton_, &QPushButton::clicked, this, &ConverterWindow::handleBrowseOutput);
    connect(startButton_, &QPushButton::clicked, this, &ConverterWindow::startConversion);
}

void ConverterWindow::applySettings()
{
    bool ok = false;
    const ConversionKind kind = ConverterRegistry::kindFromId(settings_.conversionType, &ok);
    if (!ok) qWarning().noquote() << "[ui] unknown conversion_type in config:" << settings_.conversionType;
    setCurrentKind(kind);
    outputEdit_->setText(QDir::toNativeSeparators(settings_.outputDir));
}

void ConverterWindow::persistSettings()
{
    settings_.conversionType = ConverterRegistry::kindId(currentKind());
    settings_.outputDir = QDir::fromNativeSeparators(outputEdit_->text().trimmed());
    const QString input = inputEdit_->text().trimmed();
    if (!input.isEmpty()) settings_.lastInputDir = QFileInfo(input).absolutePath();
    if (!settings_.saveFile(ctx_.configPath)) qWarning().noquote() << "[ui] failed to save" << ctx_.configPath;
}

ConversionKind ConverterWindow::currentKind() const
{
    const int id = kindGroup_->checkedId();
    return id < 0 ? ConversionKind::WordToPdf : static_cast<ConversionKind>(id);
}

void ConverterWindow::setCurrentKind(ConversionKind kind)
{
    if (QAbstractButton *button = kindGroup_->button(static_cast<int>(kind))) button->setChecked(true);
}

void ConverterWindow::setInputFile(const QString &path) { inputEdit_->setText(QDir::toNativeSeparators(path)); }

void ConverterWindow::setOutputDir(const QString &path) { outputEdit_->setText(QDir::toNativeSeparators(path)); }

bool ConverterWindow::isConverting() const { return convertWatcher_.isRunning(); }

void ConverterWindow::handleBrowseInput()
{
    QString startDir = settings_.lastInputDir;
    const QString current = inputEdit_->text().trimmed();
    if (!current.isEmpty()) startDir = QFileInfo(current).absolutePath();
    const QString file = QFileDialog::getOpenFileName(this, QStringLiteral("选择文件"), startDir,
                                                      ConverterRegistry::fileFilter(currentKind()));
    if (file.isEmpty()) return;
    setInputFile(file);
    settings_.lastInputDir = QFileInfo(file).absolutePath();
}

void ConverterWindow::handleBrowseOutput()
{
    const QString dir = QFileDialog::getExistingDirectory(this, QStringLiteral("输出目录"), outputEdit_->text().trimmed());
    if (!dir.isEmpty()) setOutputDir(dir);
}

void ConverterWindow::startConversion()
{
    if (isConverting()) return;
    const QString input = QDir::fromNativeSeparators(inputEdit_->text().trimmed());
    const QString outDir = QDir::fromNativeSeparators(outputEdit_->text().trimmed());
    if (input.isEmpty())
    {
        QMessageBox::critical(this, QStringLiteral("错误"), QStringLiteral("请选择要转换的文件"));
        return;
    }
    if (outDir.isEmpty())
    {
        QMessageBox::critical(this, QStringLiteral("错误"), QStringLiteral("请选择输出目录"));
        return;
    }

    persistSettings();
    setBusy(true);
    const ConversionKind kind = currentKind();
    const ConversionOptions options = settings_.toOptions();
    auto future = QtConcurrent::run([kind, input, outDir, options]() -> ConversionResult {
        return ConverterRegistry::run(kind, input, outDir, options);
    });
    convertWatcher_.setFuture(future);
}

void ConverterWindow::handleConversionFinished()
{
    if (!convertWatcher_.isFinished()) return;
    const ConversionResult result = convertWatcher_.result();
    setBusy(false);
    statusLabel_->setText(result.ok ? QStringLiteral("转换完成") : QStringLiteral("转换失败"));
    showResult(result);
}

void ConverterWindow::setBusy(bool busy)
{
    typeBox_->setEnabled(!busy);
    inputEdit_->setEnabled(!busy);
    outputEdit_->setEnabled(!busy);
    browseInputButton_->setEnabled(!busy);
    browseOutputButton_->setEnabled(!busy);
    startButton_->setEnabled(!busy);
    if (busy)
    {
        progress_->setRange(0, 0); // 不确定进度
        statusLabel_->setText(QStringLiteral("转换中..."));
    }
    else
    {
        progress_->setRange(0, 1);
        progress_->setValue(0);
    }
}

void ConverterWindow::showResult(const ConversionResult &result)
{
    if (!result.ok)
    {
        QMessageBox::critical(this, QStringLiteral("错误"), QStringLiteral("转换失败：%1").arg(result.errorText()));
        return;
    }
    QString text = QStringLiteral("文件转换完成！\n输出文件：%1").arg(QDir::toNativeSeparators(result.primaryOutput()));
    if (result.outputs.size() > 1) text += QStringLiteral("\n共生成 %1 个文件").arg(result.outputs.size());
    if (!result.warnings.isEmpty()) text += QStringLiteral("\n\n提示：\n") + result.warnings.join(QLatin1Char('\n'));
    QMessageBox::information(this, QStringLiteral("成功"), text);
}

void ConverterWindow::closeEvent(QCloseEvent *event)
{
    if (isConverting())
    {
        // 转换无法取消，等待结束后再关闭
        QMessageBox::information(this, QStringLiteral("提示"), QStringLiteral("转换进行中，请稍候"));
        event->ignore();
        return;
    }
    persistSettings();
    QWidget::closeEvent(event);
}
