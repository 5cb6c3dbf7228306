#pragma once

#include <memory>

#include <QMainWindow>

#include "typemaster/qt_repeating_timer.hpp"
#include "typemaster/session_controller.hpp"
#include "typemaster/settings_store.hpp"
#include "typemaster/types.hpp"

class QComboBox;
class QFrame;
class QLabel;
class QPlainTextEdit;
class QPushButton;
class QRadioButton;

namespace typemaster {

class MainWindow final : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

private slots:
    void handle_start_clicked();
    void handle_input_changed();
    void handle_difficulty_changed(int index);
    void handle_theme_toggled(bool checked);
    void handle_tick();

private:
    SettingsStore settings_store_;
    AppSettings settings_;
    QtRepeatingTimer tick_timer_;
    std::unique_ptr<SessionController> controller_;

    QRadioButton* light_radio_{nullptr};
    QRadioButton* dark_radio_{nullptr};
    QComboBox* difficulty_combo_{nullptr};
    QFrame* wpm_frame_{nullptr};
    QLabel* wpm_value_label_{nullptr};
    QLabel* time_label_{nullptr};
    QPlainTextEdit* sentence_view_{nullptr};
    QPlainTextEdit* input_edit_{nullptr};
    QPushButton* start_button_{nullptr};

    void build_ui();
    void load_sentence_bank();
    void apply_theme();
    void save_settings();
    void clear_input();
    void show_current_sentence();
    void render_input_marks();
    void update_stats_labels();
    void update_start_button();
    void finish_session(const Result& result);
};

} // namespace typemaster
