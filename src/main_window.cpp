#include "typemaster/main_window.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typemaster/difficulty.hpp"
#include "typemaster/errors.hpp"
#include "typemaster/logging.hpp"
#include "typemaster/results_reporter.hpp"
#include "typemaster/sentence_bank.hpp"
#include "typemaster/theme.hpp"

#include <QButtonGroup>
#include <QByteArray>
#include <QColor>
#include <QComboBox>
#include <QFile>
#include <QFont>
#include <QFrame>
#include <QHBoxLayout>
#include <QLabel>
#include <QList>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QRadioButton>
#include <QSignalBlocker>
#include <QTextCharFormat>
#include <QTextCursor>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QWidget>

namespace typemaster {
namespace {

constexpr std::string_view kEmbeddedSentences = ":/sentences/sentences.txt";
constexpr Seconds kLiveWpmWarmup{1.0};

// Marks are per code point; the editor counts UTF-16 units.
std::vector<CharClass> marks_per_unit(const QString& text, const std::vector<CharClass>& marks) {
    std::vector<CharClass> result;
    result.reserve(static_cast<std::size_t>(text.size()));

    std::size_t mark = 0;
    int position = 0;
    while (position < text.size() && mark < marks.size()) {
        const bool surrogate_pair = text.at(position).isHighSurrogate() && position + 1 < text.size() &&
                                    text.at(position + 1).isLowSurrogate();
        const int units = surrogate_pair ? 2 : 1;
        for (int unit = 0; unit < units; ++unit) {
            result.push_back(marks[mark]);
        }
        ++mark;
        position += units;
    }
    return result;
}

QString color_for(const CharClass mark, const ThemePalette& palette) {
    switch (mark) {
        case CharClass::Correct:
            return QString::fromStdString(palette.correct);
        case CharClass::Incorrect:
            return QString::fromStdString(palette.incorrect);
        case CharClass::Extra:
            return QString::fromStdString(palette.extra);
    }
    return QString::fromStdString(palette.foreground);
}

SentenceBank read_embedded_bank() {
    QFile file(QString::fromUtf8(kEmbeddedSentences.data(), static_cast<int>(kEmbeddedSentences.size())));
    if (!file.open(QIODevice::ReadOnly)) {
        throw LoadError("Embedded sentence resource is missing.");
    }
    const QByteArray data = file.readAll();
    return SentenceBank::parse(std::string_view(data.constData(), static_cast<std::size_t>(data.size())));
}

const char* reason_name(const FinishReason reason) {
    return reason == FinishReason::TimedOut ? "timed out" : "completed";
}

} // namespace

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent),
      settings_store_("settings.TMCFG"),
      settings_(settings_store_.load()),
      tick_timer_(settings_.tick_interval_ms) {
    build_ui();
    apply_theme();
    load_sentence_bank();

    tick_timer_.on_timeout([this]() { handle_tick(); });

    update_stats_labels();
    update_start_button();
}

MainWindow::~MainWindow() {
    tick_timer_.stop();
}

void MainWindow::build_ui() {
    setWindowTitle("Typing Speed Test");
    resize(900, 700);

    auto* central = new QWidget(this);
    central->setObjectName("central");
    auto* root_layout = new QVBoxLayout(central);
    root_layout->setContentsMargins(20, 16, 20, 20);
    root_layout->setSpacing(12);

    auto* top_bar = new QHBoxLayout();
    top_bar->setSpacing(8);

    light_radio_ = new QRadioButton("Light", central);
    dark_radio_ = new QRadioButton("Dark", central);
    auto* theme_group = new QButtonGroup(this);
    theme_group->addButton(light_radio_);
    theme_group->addButton(dark_radio_);
    light_radio_->setChecked(settings_.theme == Theme::Light);
    dark_radio_->setChecked(settings_.theme == Theme::Dark);

    difficulty_combo_ = new QComboBox(central);
    difficulty_combo_->setObjectName("difficulty");
    difficulty_combo_->setMinimumWidth(160);
    for (const Difficulty difficulty : kAllDifficulties) {
        difficulty_combo_->addItem(QString::fromStdString(difficulty_to_string(difficulty)));
    }
    difficulty_combo_->setCurrentIndex(static_cast<int>(settings_.difficulty));

    wpm_frame_ = new QFrame(central);
    wpm_frame_->setObjectName("wpmBox");
    auto* wpm_layout = new QVBoxLayout(wpm_frame_);
    wpm_layout->setContentsMargins(12, 6, 12, 6);
    wpm_layout->setSpacing(0);
    auto* wpm_title = new QLabel("WPM", wpm_frame_);
    wpm_value_label_ = new QLabel("0", wpm_frame_);
    QFont wpm_font = wpm_value_label_->font();
    wpm_font.setPointSize(14);
    wpm_font.setBold(true);
    wpm_value_label_->setFont(wpm_font);
    wpm_title->setAlignment(Qt::AlignCenter);
    wpm_value_label_->setAlignment(Qt::AlignCenter);
    wpm_layout->addWidget(wpm_title);
    wpm_layout->addWidget(wpm_value_label_);

    top_bar->addWidget(light_radio_);
    top_bar->addWidget(dark_radio_);
    top_bar->addStretch(1);
    top_bar->addWidget(difficulty_combo_);
    top_bar->addStretch(1);
    top_bar->addWidget(wpm_frame_);
    root_layout->addLayout(top_bar);

    time_label_ = new QLabel(central);
    time_label_->setAlignment(Qt::AlignRight);
    root_layout->addWidget(time_label_);

    QFont text_font = font();
    text_font.setPointSize(12);

    sentence_view_ = new QPlainTextEdit(central);
    sentence_view_->setReadOnly(true);
    sentence_view_->setFont(text_font);
    sentence_view_->setPlaceholderText("Press Start Test to get a sentence.");
    root_layout->addWidget(sentence_view_, 1);

    input_edit_ = new QPlainTextEdit(central);
    input_edit_->setFont(text_font);
    input_edit_->setReadOnly(true);
    input_edit_->setPlaceholderText("Type the sentence here...");
    root_layout->addWidget(input_edit_, 1);

    start_button_ = new QPushButton("Start Test", central);
    start_button_->setObjectName("startButton");
    start_button_->setMinimumWidth(160);
    auto* bottom_bar = new QHBoxLayout();
    bottom_bar->addStretch(1);
    bottom_bar->addWidget(start_button_);
    bottom_bar->addStretch(1);
    root_layout->addLayout(bottom_bar);

    setCentralWidget(central);

    connect(start_button_, &QPushButton::clicked, this, &MainWindow::handle_start_clicked);
    connect(input_edit_, &QPlainTextEdit::textChanged, this, &MainWindow::handle_input_changed);
    connect(difficulty_combo_, &QComboBox::currentIndexChanged, this, &MainWindow::handle_difficulty_changed);
    connect(dark_radio_, &QRadioButton::toggled, this, &MainWindow::handle_theme_toggled);
}

void MainWindow::load_sentence_bank() {
    try {
        SentenceBank bank = settings_.sentence_file.empty()
                                ? read_embedded_bank()
                                : SentenceBank::load_file(settings_.sentence_file);
        qCInfo(lcApp) << "Loaded" << bank.total() << "sentences from"
                      << (settings_.sentence_file.empty() ? QString::fromUtf8(kEmbeddedSentences.data())
                                                          : QString::fromStdString(settings_.sentence_file));

        controller_ = std::make_unique<SessionController>(std::move(bank), tick_timer_);
        try {
            controller_->select_difficulty(settings_.difficulty);
        } catch (const LoadError& error) {
            qCWarning(lcApp) << "Stored difficulty unavailable:" << error.what();
            for (const Difficulty difficulty : kAllDifficulties) {
                if (controller_->bank().has_tier(difficulty)) {
                    controller_->select_difficulty(difficulty);
                    break;
                }
            }
            const QSignalBlocker blocker(difficulty_combo_);
            difficulty_combo_->setCurrentIndex(static_cast<int>(controller_->difficulty()));
        }
    } catch (const LoadError& error) {
        controller_.reset();
        qCWarning(lcApp) << "Sentence bank failed to load:" << error.what();
        QMessageBox::critical(this, "Sentence Bank", QString("Failed to load sentences:\n%1").arg(error.what()));
    }

    const bool usable = controller_ != nullptr;
    start_button_->setEnabled(usable);
    difficulty_combo_->setEnabled(usable);
}

void MainWindow::apply_theme() {
    const ThemePalette palette = palette_for(settings_.theme);
    const auto q = [](const std::string& value) { return QString::fromStdString(value); };

    setStyleSheet(
        QString(
            "QMainWindow, QWidget#central { background: %1; }"
            "QLabel, QRadioButton { color: %3; }"
            "QPlainTextEdit { background: %2; color: %3; border: none; border-radius: 18px; padding: 16px; }"
            "QFrame#wpmBox { background: %4; border-radius: 6px; }"
            "QFrame#wpmBox QLabel { color: %5; }"
            "QComboBox#difficulty { background: %4; color: %5; padding: 4px 8px; font-weight: 600; }"
            "QPushButton#startButton { background: %4; color: %5; padding: 12px; border: none; font-weight: 600; }"
            "QPushButton#startButton:hover { background: %1; color: %3; }"
        )
            .arg(q(palette.window_background))
            .arg(q(palette.text_background))
            .arg(q(palette.foreground))
            .arg(q(palette.inverted_background))
            .arg(q(palette.inverted_foreground))
    );

    render_input_marks();
}

void MainWindow::save_settings() {
    if (!settings_store_.save(settings_)) {
        qCWarning(lcApp) << "Unable to write settings to"
                         << QString::fromStdString(settings_store_.path().string());
    }
}

void MainWindow::clear_input() {
    const QSignalBlocker blocker(input_edit_);
    input_edit_->clear();
    input_edit_->setExtraSelections({});
}

void MainWindow::show_current_sentence() {
    if (controller_ == nullptr || !controller_->session().has_value()) {
        sentence_view_->clear();
        return;
    }
    sentence_view_->setPlainText(QString::fromStdString(controller_->session()->target.text));
}

void MainWindow::render_input_marks() {
    if (input_edit_ == nullptr) {
        return;
    }
    if (controller_ == nullptr || !controller_->session().has_value()) {
        input_edit_->setExtraSelections({});
        return;
    }

    const ThemePalette palette = palette_for(settings_.theme);
    const QString text = input_edit_->toPlainText();
    const std::vector<CharClass> marks = marks_per_unit(text, controller_->classification().marks);

    QList<QTextEdit::ExtraSelection> selections;
    std::size_t start = 0;
    while (start < marks.size()) {
        std::size_t end = start + 1;
        while (end < marks.size() && marks[end] == marks[start]) {
            ++end;
        }

        QTextEdit::ExtraSelection selection;
        selection.cursor = QTextCursor(input_edit_->document());
        selection.cursor.setPosition(static_cast<int>(start));
        selection.cursor.setPosition(static_cast<int>(end), QTextCursor::KeepAnchor);
        selection.format.setForeground(QColor(color_for(marks[start], palette)));
        if (marks[start] == CharClass::Incorrect) {
            selection.format.setFontUnderline(true);
        }
        selections.push_back(selection);
        start = end;
    }
    input_edit_->setExtraSelections(selections);
}

void MainWindow::update_stats_labels() {
    if (controller_ == nullptr) {
        wpm_value_label_->setText("0");
        time_label_->setText(QString("Time Left: %1").arg(QString::fromStdString(format_duration(kSessionTimeLimit))));
        return;
    }

    double wpm = 0.0;
    if (controller_->is_finished() && controller_->last_result().has_value()) {
        wpm = controller_->last_result()->net_wpm;
    } else if (controller_->elapsed() >= kLiveWpmWarmup) {
        wpm = controller_->live_wpm();
    }
    wpm_value_label_->setText(QString::number(std::lround(wpm)));
    time_label_->setText(
        QString("Time Left: %1").arg(QString::fromStdString(format_duration(controller_->remaining())))
    );
}

void MainWindow::update_start_button() {
    const bool running = controller_ != nullptr && controller_->is_running();
    start_button_->setText(running ? "Reset Test" : "Start Test");
}

void MainWindow::handle_start_clicked() {
    if (controller_ == nullptr) {
        return;
    }

    if (controller_->is_running()) {
        const Seconds abandoned_at = controller_->elapsed();
        controller_->reset();
        qCInfo(lcSession) << "Session reset after" << abandoned_at.count() << "s";
    } else {
        try {
            controller_->start();
        } catch (const LoadError& error) {
            qCWarning(lcSession) << "Unable to start session:" << error.what();
            QMessageBox::critical(this, "Start Test", QString("Unable to start a test:\n%1").arg(error.what()));
            return;
        }
        qCInfo(lcSession) << "Session ready,"
                          << QString::fromStdString(difficulty_to_string(controller_->difficulty()));
    }

    clear_input();
    show_current_sentence();
    input_edit_->setReadOnly(false);
    input_edit_->setFocus();
    update_stats_labels();
    update_start_button();
}

void MainWindow::handle_input_changed() {
    if (controller_ == nullptr) {
        return;
    }

    const bool was_running = controller_->is_running();
    const std::optional<Result> result = controller_->type(input_edit_->toPlainText().toStdString());
    if (!was_running && controller_->is_running()) {
        qCInfo(lcSession) << "Session started";
    }

    render_input_marks();
    update_stats_labels();
    update_start_button();

    if (result.has_value()) {
        finish_session(*result);
    }
}

void MainWindow::handle_difficulty_changed(const int index) {
    if (index < 0) {
        return;
    }

    Difficulty difficulty{};
    try {
        difficulty = parse_difficulty(difficulty_combo_->itemText(index).toStdString());
    } catch (const InvalidDifficulty& error) {
        qCWarning(lcApp) << error.what();
        QMessageBox::warning(this, "Difficulty", error.what());
        return;
    }

    if (controller_ == nullptr) {
        return;
    }

    const bool was_ready = controller_->session().has_value() && controller_->session()->state == SessionState::Ready;
    try {
        controller_->select_difficulty(difficulty);
    } catch (const LoadError& error) {
        qCWarning(lcApp) << "Difficulty switch failed:" << error.what();
        QMessageBox::critical(this, "Difficulty", error.what());
        const QSignalBlocker blocker(difficulty_combo_);
        difficulty_combo_->setCurrentIndex(static_cast<int>(controller_->difficulty()));
        return;
    }

    settings_.difficulty = difficulty;
    save_settings();

    if (was_ready) {
        clear_input();
        show_current_sentence();
        update_stats_labels();
    }
}

void MainWindow::handle_theme_toggled(const bool checked) {
    settings_.theme = checked ? Theme::Dark : Theme::Light;
    apply_theme();
    save_settings();
}

void MainWindow::handle_tick() {
    if (controller_ == nullptr) {
        return;
    }

    const std::optional<Result> result = controller_->tick();
    update_stats_labels();
    if (result.has_value()) {
        finish_session(*result);
    }
}

void MainWindow::finish_session(const Result& result) {
    input_edit_->setReadOnly(true);
    update_stats_labels();
    update_start_button();

    qCInfo(lcSession) << "Session" << reason_name(result.reason) << "after" << result.duration.count()
                      << "s, WPM" << result.net_wpm << "errors" << result.character_errors;

    QMessageBox::information(
        this,
        QString::fromStdString(result_title(result)),
        QString::fromStdString(format_result(result))
    );

    try {
        controller_->acknowledge_results();
    } catch (const LoadError& error) {
        qCWarning(lcSession) << "Unable to draw the next sentence:" << error.what();
        QMessageBox::critical(this, "Sentence Bank", error.what());
        return;
    }

    clear_input();
    show_current_sentence();
    input_edit_->setReadOnly(false);
    input_edit_->setFocus();
    update_stats_labels();
    update_start_button();
}

} // namespace typemaster
