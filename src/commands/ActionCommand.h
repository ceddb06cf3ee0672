#pragma once

#include <QUndoCommand>

#include <QString>

#include <memory>

class Action;
class Mapper;

// Undo step holding the inverse of an action that was already performed.
class ActionCommand : public QUndoCommand {
public:
    ActionCommand(Mapper* mapper,
                  std::unique_ptr<Action> undoAction,
                  const QString& text,
                  bool alreadyApplied,
                  QUndoCommand* parent = nullptr);
    ~ActionCommand() override;

    void undo() override;
    void redo() override;

private:
    Mapper* m_mapper = nullptr;
    std::unique_ptr<Action> m_undoAction;
    std::unique_ptr<Action> m_redoAction;
    bool m_alreadyApplied = true;
    bool m_firstRedo = true;
};
