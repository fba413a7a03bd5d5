#ifndef DOCSHIFT_CONVERTER_WINDOW_H
#define DOCSHIFT_CONVERTER_WINDOW_H

#include <QFutureWatcher>
#include <QWidget>

#include "app/app_context.h"
#include "app/app_settings.h"
#include "converters/conversion_result.h"
#include "converters/converter_registry.h"

class QButtonGroup;
class QGroupBox;
class QLabel;
class QLineEdit;
class QProgressBar;
class QPushButton;

// 主窗口：选择转换类型、输入文件与输出目录，后台线程执行转换。
class ConverterWindow : public QWidget
{
    Q_OBJECT

  public:
    explicit ConverterWindow(const AppContext &ctx, QWidget *parent = nullptr);
    ~ConverterWindow() override;

    ConversionKind currentKind() const;
    void setCurrentKind(ConversionKind kind);
    void setInputFile(const QString &path);
    void setOutputDir(const QString &path);
    bool isConverting() const;

  public slots:
    void startConversion();

  protected:
    void closeEvent(QCloseEvent *event) override;

  private:
    void buildUi();
    void applySettings();
    void persistSettings();
    void setBusy(bool busy);
    void showResult(const ConversionResult &result);

    void handleBrowseInput();
    void handleBrowseOutput();
    void handleConversionFinished();

    AppContext ctx_;
    AppSettings settings_;

    QGroupBox *typeBox_ = nullptr;
    QButtonGroup *kindGroup_ = nullptr;
    QLineEdit *inputEdit_ = nullptr;
    QLineEdit *outputEdit_ = nullptr;
    QPushButton *browseInputButton_ = nullptr;
    QPushButton *browseOutputButton_ = nullptr;
    QPushButton *startButton_ = nullptr;
    QProgressBar *progress_ = nullptr;
    QLabel *statusLabel_ = nullptr;

    QFutureWatcher<ConversionResult> convertWatcher_;
};

#endif // DOCSHIFT_CONVERTER_WINDOW_H
