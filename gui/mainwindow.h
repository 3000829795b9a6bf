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
#pragma once

#include "configservices.h"
#include "partrecord.h"
#include "tabledata.h"

#include <string>
#include <wx/wx.h>

class ConsolePanel;
class wxGauge;

// Single window of the application: pick a part list, choose the label
// type and write the PDF.
class MainWindow : public wxFrame {
public:
  explicit MainWindow(const wxString &title);
  ~MainWindow();

  bool LoadTableFromPath(const std::string &path); // Load a part list

private:
  void SetupLayout();    // Create controls and sizers
  void UpdateFileInfo(); // Refresh the file summary box
  void SetStatus(const wxString &text);
  LabelVariant SelectedVariant() const;

  UserPreferencesStore prefs;
  TableData table;
  std::string tablePath;

  wxButton *chooseButton = nullptr;
  wxStaticText *fileLabel = nullptr;
  wxTextCtrl *fileInfo = nullptr;
  wxChoice *variantChoice = nullptr;
  wxButton *generateButton = nullptr;
  wxGauge *gauge = nullptr;
  wxStaticText *statusText = nullptr;
  ConsolePanel *consolePanel = nullptr;

  void OnChooseFile(wxCommandEvent &event);     // Open a .xlsx or .csv file
  void OnVariantChanged(wxCommandEvent &event); // Remember the label type
  void OnGenerate(wxCommandEvent &event);       // Lay out and save labels
  void OnCloseWindow(wxCloseEvent &event);      // Persist preferences
};
