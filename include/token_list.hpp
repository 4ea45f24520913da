// X(kind, string, is reserved word)
X(Word, "Word", false)
X(Number, "Number", false)
X(String, "String", false)
X(OpenParen, "OpenParen", false)
X(CloseParen, "CloseParen", false)
X(Create, "create", true)
X(Input, "input", true)
X(Print, "print", true)
X(Exit, "exit", true)
X(End, "End", false)
X(Unexpected, "Unexpected", false)
