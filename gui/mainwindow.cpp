/*
 * This file is part of PartsLabel.
 * Copyright (C) 2025 Luisma Peramato
 *
 * PartsLabel is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PartsLabel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PartsLabel. If not, see <https://www.gnu.org/licenses/>.
 */
#include "mainwindow.h"

#include "consolepanel.h"
#include "label_pdf_exporter.h"
#include "labelengine.h"
#include "labelstyle.h"
#include "logger.h"
#include "tableloader.h"

#include <algorithm>
#include <filesystem>
#include <wx/filename.h>
#include <wx/gauge.h>

namespace {
// Choice order of the label types.
constexpr int kSinglePartChoice = 0;
constexpr int kMultiplePartChoice = 1;
constexpr size_t kPreviewRows = 3;
} // namespace

MainWindow::MainWindow(const wxString &title)
    : wxFrame(nullptr, wxID_ANY, title, wxDefaultPosition, wxSize(760, 620)) {
  prefs.LoadUserConfig();
  SetupLayout();
  Bind(wxEVT_CLOSE_WINDOW, &MainWindow::OnCloseWindow, this);
  SetStatus("Choose a part list to begin.");
}

MainWindow::~MainWindow() = default;

void MainWindow::SetupLayout() {
  wxPanel *panel = new wxPanel(this);
  wxBoxSizer *sizer = new wxBoxSizer(wxVERTICAL);

  wxStaticText *title = new wxStaticText(panel, wxID_ANY, "Parts Labels");
  wxFont titleFont = title->GetFont();
  titleFont.SetPointSize(titleFont.GetPointSize() + 6);
  titleFont.SetWeight(wxFONTWEIGHT_BOLD);
  title->SetFont(titleFont);
  sizer->Add(title, 0, wxALL, 10);

  wxBoxSizer *fileRow = new wxBoxSizer(wxHORIZONTAL);
  chooseButton = new wxButton(panel, wxID_ANY, "Choose file...");
  fileLabel = new wxStaticText(panel, wxID_ANY, "No file selected");
  fileRow->Add(chooseButton, 0, wxRIGHT | wxALIGN_CENTER_VERTICAL, 8);
  fileRow->Add(fileLabel, 1, wxALIGN_CENTER_VERTICAL);
  sizer->Add(fileRow, 0, wxEXPAND | wxLEFT | wxRIGHT, 10);

  fileInfo = new wxTextCtrl(panel, wxID_ANY, "", wxDefaultPosition,
                            wxSize(-1, 150), wxTE_MULTILINE | wxTE_READONLY);
  sizer->Add(fileInfo, 1, wxEXPAND | wxALL, 10);

  wxBoxSizer *variantRow = new wxBoxSizer(wxHORIZONTAL);
  variantRow->Add(new wxStaticText(panel, wxID_ANY, "Label type:"), 0,
                  wxRIGHT | wxALIGN_CENTER_VERTICAL, 8);
  wxArrayString choices;
  choices.Add("Enhanced Labels (v2)");
  choices.Add("Standard Labels (v1)");
  variantChoice = new wxChoice(panel, wxID_ANY, wxDefaultPosition,
                               wxDefaultSize, choices);
  variantChoice->SetSelection(prefs.GetLabelVariant() ==
                                      LabelVariant::MultiplePart
                                  ? kMultiplePartChoice
                                  : kSinglePartChoice);
  variantRow->Add(variantChoice, 0, wxALIGN_CENTER_VERTICAL);
  sizer->Add(variantRow, 0, wxLEFT | wxRIGHT, 10);

  generateButton = new wxButton(panel, wxID_ANY, "Generate PDF Labels");
  generateButton->Enable(false);
  sizer->Add(generateButton, 0, wxALL, 10);

  gauge = new wxGauge(panel, wxID_ANY, 100);
  sizer->Add(gauge, 0, wxEXPAND | wxLEFT | wxRIGHT, 10);
  statusText = new wxStaticText(panel, wxID_ANY, "");
  sizer->Add(statusText, 0, wxEXPAND | wxALL, 10);

  consolePanel = new ConsolePanel(panel);
  sizer->Add(consolePanel, 1, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 5);

  panel->SetSizer(sizer);

  chooseButton->Bind(wxEVT_BUTTON, &MainWindow::OnChooseFile, this);
  variantChoice->Bind(wxEVT_CHOICE, &MainWindow::OnVariantChanged, this);
  generateButton->Bind(wxEVT_BUTTON, &MainWindow::OnGenerate, this);
}

void MainWindow::SetStatus(const wxString &text) {
  if (!statusText)
    return;
  statusText->SetLabel(text);
  statusText->Update();
}

LabelVariant MainWindow::SelectedVariant() const {
  if (variantChoice && variantChoice->GetSelection() == kMultiplePartChoice)
    return LabelVariant::MultiplePart;
  return LabelVariant::SinglePart;
}

bool MainWindow::LoadTableFromPath(const std::string &path) {
  TableData loaded;
  std::string error;
  if (!TableLoader::LoadFile(path, loaded, error)) {
    wxMessageBox(wxString::FromUTF8(error), "Error", wxICON_ERROR);
    consolePanel->AppendMessage("Failed to load " + wxString::FromUTF8(path),
                                ConsolePanel::MessageKind::Error);
    return false;
  }
  table = std::move(loaded);
  tablePath = path;
  fileLabel->SetLabel(wxFileName(wxString::FromUTF8(path)).GetFullName());
  UpdateFileInfo();
  generateButton->Enable(table.RowCount() > 0);
  gauge->SetValue(0);
  SetStatus("File loaded. Choose the label type and generate the PDF.");
  consolePanel->Clear();
  consolePanel->AppendMessage("Loaded " + wxString::FromUTF8(path));
  return true;
}

void MainWindow::UpdateFileInfo() {
  wxString info;
  info << "Rows: " << table.RowCount() << "\n";
  info << "Columns: " << table.ColumnCount() << "\n";
  wxString names;
  for (const auto &column : table.columns) {
    if (!names.empty())
      names << ", ";
    names << wxString::FromUTF8(column);
  }
  info << "Column names: " << names << "\n\n";

  const size_t preview = std::min(kPreviewRows, table.RowCount());
  info << "First " << preview << " rows:\n";
  for (size_t row = 0; row < preview; ++row) {
    wxString line;
    for (size_t col = 0; col < table.ColumnCount(); ++col) {
      if (col)
        line << " | ";
      line << wxString::FromUTF8(table.Cell(row, col));
    }
    info << line << "\n";
  }
  fileInfo->SetValue(info);
}

void MainWindow::OnChooseFile(wxCommandEvent &WXUNUSED(event)) {
  wxFileDialog dlg(this, "Choose a part list",
                   wxString::FromUTF8(prefs.GetLastDirectory()), "",
                   "Part lists (*.xlsx;*.csv)|*.xlsx;*.csv|"
                   "Excel workbooks (*.xlsx)|*.xlsx|CSV files (*.csv)|*.csv",
                   wxFD_OPEN | wxFD_FILE_MUST_EXIST);
  if (dlg.ShowModal() == wxID_CANCEL)
    return;

  prefs.SetLastDirectory(dlg.GetDirectory().ToStdString(wxConvUTF8));
  LoadTableFromPath(dlg.GetPath().ToStdString(wxConvUTF8));
}

void MainWindow::OnVariantChanged(wxCommandEvent &WXUNUSED(event)) {
  prefs.SetLabelVariant(SelectedVariant());
}

void MainWindow::OnGenerate(wxCommandEvent &WXUNUSED(event)) {
  if (table.RowCount() == 0)
    return;

  const LabelVariant variant = SelectedVariant();
  prefs.SetLabelVariant(variant);
  const LabelStyle style = LabelStyle::FromPreferences(prefs, variant);

  LabelEngine::GenerationObserver observer;
  observer.progress = [this](size_t index, size_t total,
                             const std::string &key) {
    gauge->SetRange(static_cast<int>(std::max<size_t>(total, 1)));
    gauge->SetValue(static_cast<int>(index + 1));
    SetStatus(wxString::Format("Processing location %d/%d: ",
                               static_cast<int>(index + 1),
                               static_cast<int>(total)) +
              wxString::FromUTF8(key));
    gauge->Update();
  };
  observer.diagnostic = [this](const std::string &message) {
    consolePanel->AppendMessage(wxString::FromUTF8(message),
                                ConsolePanel::MessageKind::Warning);
  };

  consolePanel->BeginRun(variant == LabelVariant::MultiplePart
                             ? "Standard Labels (v1)"
                             : "Enhanced Labels (v2)");
  LabelEngine::GenerationResult result;
  {
    wxBusyCursor busy;
    generateButton->Enable(false);
    result = LabelEngine::Generate(table, style, observer);
    generateButton->Enable(true);
  }
  consolePanel->AppendMessage(wxString::FromUTF8(result.columns.Describe()));
  if (!result.skipped.empty())
    consolePanel->AppendMessage(
        wxString::Format("%d location(s) skipped",
                         static_cast<int>(result.skipped.size())),
        ConsolePanel::MessageKind::Warning);

  if (!result.HasDocument()) {
    SetStatus("No labels were generated.");
    wxMessageBox("No labels were generated. Check that the file has the "
                 "expected columns.",
                 "Error", wxICON_ERROR);
    return;
  }
  SetStatus(wxString::Format("Generated %d label(s) on %d page(s).",
                             static_cast<int>(result.document->BlockCount()),
                             static_cast<int>(result.document->pages.size())));

  wxString defaultDir = wxString::FromUTF8(prefs.GetLastDirectory());
  wxFileDialog dlg(this, "Save PDF Labels", defaultDir,
                   DefaultLabelFileName(variant), "PDF files (*.pdf)|*.pdf",
                   wxFD_SAVE | wxFD_OVERWRITE_PROMPT);
  if (dlg.ShowModal() == wxID_CANCEL)
    return;

  LabelPrintOptions options;
  options.compressStreams = prefs.GetCompressPdf();
  const std::string outPath = dlg.GetPath().ToStdString(wxConvUTF8);
  LabelExportResult exported =
      ExportLabelsToPdf(*result.document, options, std::filesystem::u8path(outPath));
  if (!exported.success) {
    wxMessageBox(wxString::FromUTF8(exported.message), "Error", wxICON_ERROR);
    consolePanel->AppendMessage("Failed to save " + dlg.GetPath(),
                                ConsolePanel::MessageKind::Error);
    return;
  }
  prefs.SetLastDirectory(dlg.GetDirectory().ToStdString(wxConvUTF8));
  prefs.SaveUserConfig();
  SetStatus("PDF labels generated successfully.");
  consolePanel->AppendMessage("Saved " + dlg.GetPath());
}

void MainWindow::OnCloseWindow(wxCloseEvent &event) {
  if (!prefs.SaveUserConfig())
    Logger::Instance().Warning("Failed to save user preferences");
  event.Skip();
}
